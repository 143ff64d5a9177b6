#ifndef WATCHPOST_NRPE_PACKET_HPP
#define WATCHPOST_NRPE_PACKET_HPP
/**
 * @file Packet.hpp
 * @brief NRPE v2 query/response codec and protocol error taxonomy.
 * @note Thread-safe: All functions are stateless.
 *
 * buildQuery() produces the exact bytes a check_nrpe style client sends.
 * parseResponse() validates length, version, packet type and checksum, in
 * that order, and reports the first failure as a distinct NrpeStatus.
 */

#include "src/nrpe/inc/PacketLayout.hpp"

#include <cstdint>     // std::int16_t, std::int64_t
#include <span>        // std::span
#include <string>      // std::string
#include <string_view> // std::string_view

namespace watchpost {

namespace nrpe {

/* ----------------------------- NrpeStatus ----------------------------- */

/**
 * @brief Outcome of a codec or transport operation.
 */
enum class NrpeStatus : std::uint8_t {
  OK = 0,
  MALFORMED_PACKET,       ///< Received bytes do not unpack into the fixed layout
  VERSION_MISMATCH,       ///< Response version is not PROTOCOL_VERSION
  UNEXPECTED_PACKET_TYPE, ///< Packet is not a response
  CHECKSUM_MISMATCH,      ///< Recomputed CRC-32 differs from the declared one
  COMMAND_TOO_LONG,       ///< Payload exceeds BUFFER_SIZE
  CONNECT_ERROR,          ///< Resolve or TCP connect failed
  TLS_ERROR,              ///< TLS setup or handshake failed
  TIMEOUT_ERROR,          ///< A blocking step exceeded the configured timeout
  IO_ERROR,               ///< Send/receive failed after connecting (reset, short write)
};

/**
 * @brief Human-readable status string.
 * @note RT-safe: Returns static string pointer.
 */
[[nodiscard]] const char* toString(NrpeStatus status) noexcept;

/* ----------------------------- ProtocolError ----------------------------- */

/**
 * @brief Inspectable failure detail.
 *
 * expected/actual are set for MALFORMED_PACKET (byte counts), VERSION_MISMATCH,
 * UNEXPECTED_PACKET_TYPE, CHECKSUM_MISMATCH and COMMAND_TOO_LONG (capacity vs
 * length). sysErrno and detail are set for transport failures.
 */
struct ProtocolError {
  NrpeStatus status{NrpeStatus::OK};
  std::int64_t expected{0};
  std::int64_t actual{0};
  int sysErrno{0};    ///< errno of the failing syscall, 0 if none
  std::string detail; ///< Resolver/OpenSSL message, empty if none

  [[nodiscard]] bool ok() const noexcept { return status == NrpeStatus::OK; }

  /// @brief One-line description, e.g. "CHECKSUM_MISMATCH: expected 0x... got 0x...".
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- NrpeResult ----------------------------- */

/**
 * @brief Parsed response, or the error that prevented it.
 */
struct NrpeResult {
  std::int16_t resultCode{0}; ///< Nagios state reported by the remote plugin
  std::string message;        ///< Plugin output, trailing NULs stripped
  ProtocolError error{};

  [[nodiscard]] bool ok() const noexcept { return error.ok(); }

  /// @brief "(resultCode, 'message')" on success, error text otherwise.
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Build a query packet for a command line.
 * @param command Command and arguments as understood by the daemon
 *        (e.g. "check_load" or "check_disk!20%!10%").
 * @param out Receives the 1036-byte packet; untouched on failure.
 * @return OK, or COMMAND_TOO_LONG if command exceeds BUFFER_SIZE bytes.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] ProtocolError buildQuery(std::string_view command, PacketBytes& out) noexcept;

/**
 * @brief Build a response packet, as the daemon would send it.
 * @param resultCode Nagios state of the executed plugin.
 * @param message Plugin output.
 * @param out Receives the 1036-byte packet; untouched on failure.
 * @return OK, or COMMAND_TOO_LONG if message exceeds BUFFER_SIZE bytes.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] ProtocolError buildResponse(std::int16_t resultCode, std::string_view message,
                                          PacketBytes& out) noexcept;

/**
 * @brief Validate and decode a received response packet.
 * @param bytes Everything read from the connection.
 * @return Result code and message, or the first validation failure.
 * @note NOT RT-safe: Allocates the message string.
 */
[[nodiscard]] NrpeResult parseResponse(std::span<const std::uint8_t> bytes);

/**
 * @brief Strip trailing NUL padding from a payload buffer.
 * @note NOT RT-safe: Allocates the result string.
 */
[[nodiscard]] std::string payloadToString(const PacketBuffer& buffer);

} // namespace nrpe

} // namespace watchpost

#endif // WATCHPOST_NRPE_PACKET_HPP
