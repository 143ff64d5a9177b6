/**
 * @file nrpe-query.cpp
 * @brief Run one command on a remote NRPE daemon and report its result.
 *
 * Prints "(result_code, 'message')" for a successful exchange and exits with
 * the remote plugin's state, so the tool can itself serve as a Nagios check.
 *
 * Exit codes: 0=OK, 1=WARNING, 2=CRITICAL, 3=UNKNOWN (also for any protocol,
 * transport or usage error)
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/nrpe/inc/Client.hpp"
#include "src/nrpe/inc/NagiosState.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace nrpe = watchpost::nrpe;
namespace strs = watchpost::helpers::strings;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_VERBOSE = 2,
  ARG_PORT = 3,
  ARG_TIMEOUT = 4,
  ARG_TLS = 5,
  ARG_CA = 6,
  ARG_CERT = 7,
  ARG_KEY = 8,
};

/// Operand synopsis for --help.
constexpr std::string_view OPERANDS = "<command> <host>";

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Execute <command> on the NRPE daemon at <host> and print (result_code, message).\n\n"
    "TLS modes: adh (default, legacy anonymous DH; no authentication of the\n"
    "daemon), verify (certificate-verified, optionally mutual), none (plain TCP).\n\n"
    "Exit codes: the remote plugin's state (0-3); 3=UNKNOWN on any error";

/// Build argument definitions.
watchpost::helpers::args::ArgMap buildArgMap() {
  watchpost::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Trace the exchange on stderr"};
  map[ARG_PORT] = {"--port", 1, false, "Daemon port (default 5666)"};
  map[ARG_TIMEOUT] = {"--timeout", 1, false, "Per-step timeout in seconds (default: none)"};
  map[ARG_TLS] = {"--tls", 1, false, "TLS mode: adh, verify or none (default adh)"};
  map[ARG_CA] = {"--ca", 1, false, "CA bundle for --tls verify (default: system store)"};
  map[ARG_CERT] = {"--cert", 1, false, "Client certificate for --tls verify"};
  map[ARG_KEY] = {"--key", 1, false, "Client private key (default: --cert file)"};
  return map;
}

/// Fill the client configuration from parsed flags.
bool buildConfig(const watchpost::helpers::args::ParsedArgs& pargs, nrpe::ClientConfig& cfg,
                 std::string& error) {
  if (pargs.has(ARG_PORT) && !strs::parsePort(pargs.value(ARG_PORT), cfg.port)) {
    error = fmt::format("Invalid port '{}'", pargs.value(ARG_PORT));
    return false;
  }
  if (pargs.has(ARG_TIMEOUT) && !strs::parseSeconds(pargs.value(ARG_TIMEOUT), cfg.timeout)) {
    error = fmt::format("Invalid timeout '{}'", pargs.value(ARG_TIMEOUT));
    return false;
  }
  if (pargs.has(ARG_TLS) && !nrpe::parseTlsMode(pargs.value(ARG_TLS), cfg.tls.mode)) {
    error = fmt::format("Invalid TLS mode '{}'", pargs.value(ARG_TLS));
    return false;
  }

  cfg.tls.caFile = std::string(pargs.value(ARG_CA));
  cfg.tls.certFile = std::string(pargs.value(ARG_CERT));
  cfg.tls.keyFile = std::string(pargs.value(ARG_KEY));

  const bool HAS_CERT_OPTS = !cfg.tls.caFile.empty() || !cfg.tls.certFile.empty() ||
                             !cfg.tls.keyFile.empty();
  if (HAS_CERT_OPTS && cfg.tls.mode != nrpe::TlsMode::VERIFIED) {
    error = "--ca/--cert/--key require --tls verify";
    return false;
  }
  return true;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const nrpe::NrpeResult& result) {
  if (result.ok()) {
    fmt::print("{}\n", result.toString());
  } else {
    fmt::print("UNKNOWN: {}\n", result.error.toString());
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(std::string_view command, const std::string& host,
               const nrpe::ClientConfig& cfg, const nrpe::NrpeResult& result) {
  fmt::print("{{\n");
  fmt::print("  \"command\": \"{}\",\n", strs::escapeJson(command));
  fmt::print("  \"host\": \"{}\",\n", strs::escapeJson(host));
  fmt::print("  \"port\": {},\n", cfg.port);
  fmt::print("  \"tls\": \"{}\",\n", nrpe::toString(cfg.tls.mode));
  fmt::print("  \"ok\": {},\n", result.ok());

  if (result.ok()) {
    fmt::print("  \"resultCode\": {},\n", result.resultCode);
    fmt::print("  \"state\": \"{}\",\n", nrpe::toString(nrpe::fromResultCode(result.resultCode)));
    fmt::print("  \"message\": \"{}\"\n", strs::escapeJson(result.message));
  } else {
    fmt::print("  \"state\": \"{}\",\n", nrpe::toString(nrpe::NagiosState::UNKNOWN));
    fmt::print("  \"error\": \"{}\",\n", nrpe::toString(result.error.status));
    fmt::print("  \"detail\": \"{}\"\n", strs::escapeJson(result.error.toString()));
  }

  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const int UNKNOWN_EXIT = nrpe::exitCode(nrpe::NagiosState::UNKNOWN);
  const watchpost::helpers::args::ArgMap ARG_MAP = buildArgMap();
  watchpost::helpers::args::ParsedArgs pargs;

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  std::string error;
  if (!watchpost::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    watchpost::helpers::args::printUsage(argv[0], OPERANDS, DESCRIPTION, ARG_MAP, stderr);
    return UNKNOWN_EXIT;
  }

  if (pargs.has(ARG_HELP)) {
    watchpost::helpers::args::printUsage(argv[0], OPERANDS, DESCRIPTION, ARG_MAP);
    return 0;
  }

  if (pargs.positional.size() != 2) {
    fmt::print(stderr, "Error: expected {} operands, got {}\n\n", OPERANDS,
               pargs.positional.size());
    watchpost::helpers::args::printUsage(argv[0], OPERANDS, DESCRIPTION, ARG_MAP, stderr);
    return UNKNOWN_EXIT;
  }

  nrpe::ClientConfig cfg{};
  if (!buildConfig(pargs, cfg, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return UNKNOWN_EXIT;
  }

  const std::string_view COMMAND = pargs.positional[0];
  const std::string HOST(pargs.positional[1]);
  const bool VERBOSE = pargs.has(ARG_VERBOSE);

  if (VERBOSE) {
    fmt::print(stderr, "nrpe-query: {}:{} tls={} timeout={}\n", HOST, cfg.port,
               nrpe::toString(cfg.tls.mode),
               cfg.timeout.count() > 0 ? fmt::format("{}ms", cfg.timeout.count()) : "none");
    if (cfg.tls.mode == nrpe::TlsMode::ANONYMOUS_DH) {
      fmt::print(stderr, "nrpe-query: warning: anonymous DH does not authenticate the daemon\n");
    }
  }

  const auto START = std::chrono::steady_clock::now();
  const nrpe::NrpeResult RESULT = nrpe::sendQuery(COMMAND, HOST, cfg);
  const auto ELAPSED = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - START);

  if (VERBOSE) {
    fmt::print(stderr, "nrpe-query: status={} elapsed={}ms\n", nrpe::toString(RESULT.error.status),
               ELAPSED.count());
  }

  if (pargs.has(ARG_JSON)) {
    printJson(COMMAND, HOST, cfg, RESULT);
  } else {
    printHuman(RESULT);
  }

  if (!RESULT.ok()) {
    return UNKNOWN_EXIT;
  }
  return nrpe::exitCode(nrpe::fromResultCode(RESULT.resultCode));
}
