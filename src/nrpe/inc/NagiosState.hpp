#ifndef WATCHPOST_NRPE_NAGIOS_STATE_HPP
#define WATCHPOST_NRPE_NAGIOS_STATE_HPP
/**
 * @file NagiosState.hpp
 * @brief Nagios plugin states carried in the NRPE result code.
 */

#include <cstdint> // std::int16_t

namespace watchpost {

namespace nrpe {

/**
 * @brief Plugin state; values are the plugin exit codes.
 */
enum class NagiosState : std::uint8_t {
  OK = 0,
  WARNING = 1,
  CRITICAL = 2,
  UNKNOWN = 3,
};

/// @brief Upper-case state name, as printed in plugin output.
[[nodiscard]] const char* toString(NagiosState state) noexcept;

/// @brief Map a response result code; anything outside 0..3 is UNKNOWN.
[[nodiscard]] NagiosState fromResultCode(std::int16_t resultCode) noexcept;

/// @brief Process exit code for a state.
[[nodiscard]] constexpr int exitCode(NagiosState state) noexcept {
  return static_cast<int>(state);
}

} // namespace nrpe

} // namespace watchpost

#endif // WATCHPOST_NRPE_NAGIOS_STATE_HPP
