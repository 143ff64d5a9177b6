/**
 * @file Client.cpp
 * @brief NRPE client request/response cycle.
 */

#include "src/nrpe/inc/Client.hpp"

#include <vector>

namespace watchpost {

namespace nrpe {

NrpeResult sendQuery(std::string_view command, const std::string& host,
                     const ClientConfig& config) {
  NrpeResult result{};

  PacketBytes query{};
  result.error = buildQuery(command, query);
  if (!result.ok()) {
    return result;
  }

  TransportConfig transport{};
  transport.host = host;
  transport.port = config.port;
  transport.tls = config.tls;
  transport.timeout = config.timeout;

  std::vector<std::uint8_t> response;
  result.error = connectAndExchange(transport, query, response);
  if (!result.ok()) {
    return result;
  }

  return parseResponse(response);
}

NrpeResult sendQuery(std::string_view command, const std::string& host, std::uint16_t port,
                     bool useTls, std::chrono::milliseconds timeout) {
  ClientConfig config{};
  config.port = port;
  config.tls.mode = useTls ? TlsMode::ANONYMOUS_DH : TlsMode::NONE;
  config.timeout = timeout;
  return sendQuery(command, host, config);
}

} // namespace nrpe

} // namespace watchpost
