/**
 * @file NagiosState.cpp
 * @brief Nagios state helpers.
 */

#include "src/nrpe/inc/NagiosState.hpp"

namespace watchpost {

namespace nrpe {

const char* toString(NagiosState state) noexcept {
  switch (state) {
  case NagiosState::OK:
    return "OK";
  case NagiosState::WARNING:
    return "WARNING";
  case NagiosState::CRITICAL:
    return "CRITICAL";
  case NagiosState::UNKNOWN:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

NagiosState fromResultCode(std::int16_t resultCode) noexcept {
  switch (resultCode) {
  case 0:
    return NagiosState::OK;
  case 1:
    return NagiosState::WARNING;
  case 2:
    return NagiosState::CRITICAL;
  default:
    return NagiosState::UNKNOWN;
  }
}

} // namespace nrpe

} // namespace watchpost
