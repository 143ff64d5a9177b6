#ifndef WATCHPOST_NRPE_CLIENT_HPP
#define WATCHPOST_NRPE_CLIENT_HPP
/**
 * @file Client.hpp
 * @brief NRPE client: run one command on a remote daemon.
 * @note Thread-safe: Stateless; concurrent calls each use their own connection.
 *
 * Each call is one independent cycle:
 *   build query -> connect -> [handshake] -> send -> receive -> parse.
 * Nothing is retried, cached or reused. The first failure ends the call and is
 * returned in NrpeResult::error.
 *
 * @warning NOT RT-safe: Blocking network I/O and allocation.
 */

#include "src/nrpe/inc/Packet.hpp"
#include "src/nrpe/inc/TlsBackend.hpp"
#include "src/nrpe/inc/Transport.hpp"

#include <chrono>      // std::chrono::milliseconds
#include <cstdint>     // std::uint16_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace watchpost {

namespace nrpe {

/* ----------------------------- ClientConfig ----------------------------- */

/**
 * @brief Per-call client settings.
 */
struct ClientConfig {
  std::uint16_t port{DEFAULT_PORT};
  TlsConfig tls{};                      ///< Defaults to legacy anonymous DH
  std::chrono::milliseconds timeout{0}; ///< Per-step bound; 0 = none
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Execute command on host and return the plugin's state and output.
 * @param command Command line for the daemon (at most BUFFER_SIZE bytes).
 * @param host Daemon host name or address.
 * @param config Port, TLS and timeout settings.
 * @return (resultCode, message), or the first codec/transport error.
 */
[[nodiscard]] NrpeResult sendQuery(std::string_view command, const std::string& host,
                                   const ClientConfig& config);

/**
 * @brief Convenience form of sendQuery().
 * @param useTls true selects TlsMode::ANONYMOUS_DH, false plain TCP.
 */
[[nodiscard]] NrpeResult sendQuery(std::string_view command, const std::string& host,
                                   std::uint16_t port = DEFAULT_PORT, bool useTls = true,
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

} // namespace nrpe

} // namespace watchpost

#endif // WATCHPOST_NRPE_CLIENT_HPP
