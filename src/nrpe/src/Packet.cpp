/**
 * @file Packet.cpp
 * @brief NRPE v2 packet codec.
 */

#include "src/nrpe/inc/Packet.hpp"

#include "src/nrpe/inc/Checksum.hpp"

#include <cstring> // std::memcpy, std::strerror

#include <fmt/core.h>

namespace watchpost {

namespace nrpe {

namespace {

/* ----------------------------- Helpers ----------------------------- */

ProtocolError makeError(NrpeStatus status, std::int64_t expected, std::int64_t actual) noexcept {
  ProtocolError err{};
  err.status = status;
  err.expected = expected;
  err.actual = actual;
  return err;
}

/// Fill fields from a payload that fits; callers check the length first.
void copyPayload(std::string_view payload, PacketBuffer& buffer) noexcept {
  buffer.fill(0);
  if (!payload.empty()) {
    std::memcpy(buffer.data(), payload.data(), payload.size());
  }
}

ProtocolError encodePacket(PacketFields& fields, std::string_view payload,
                           PacketBytes& out) noexcept {
  if (payload.size() > BUFFER_SIZE) {
    return makeError(NrpeStatus::COMMAND_TOO_LONG, static_cast<std::int64_t>(BUFFER_SIZE),
                     static_cast<std::int64_t>(payload.size()));
  }

  copyPayload(payload, fields.buffer);
  fields.crc32 = packetChecksum(fields);
  out = encodeFields(fields);
  return ProtocolError{};
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(NrpeStatus status) noexcept {
  switch (status) {
  case NrpeStatus::OK:
    return "OK";
  case NrpeStatus::MALFORMED_PACKET:
    return "MALFORMED_PACKET";
  case NrpeStatus::VERSION_MISMATCH:
    return "VERSION_MISMATCH";
  case NrpeStatus::UNEXPECTED_PACKET_TYPE:
    return "UNEXPECTED_PACKET_TYPE";
  case NrpeStatus::CHECKSUM_MISMATCH:
    return "CHECKSUM_MISMATCH";
  case NrpeStatus::COMMAND_TOO_LONG:
    return "COMMAND_TOO_LONG";
  case NrpeStatus::CONNECT_ERROR:
    return "CONNECT_ERROR";
  case NrpeStatus::TLS_ERROR:
    return "TLS_ERROR";
  case NrpeStatus::TIMEOUT_ERROR:
    return "TIMEOUT_ERROR";
  case NrpeStatus::IO_ERROR:
    return "IO_ERROR";
  }
  return "UNKNOWN";
}

/* ----------------------------- ProtocolError Methods ----------------------------- */

std::string ProtocolError::toString() const {
  const char* name = nrpe::toString(status);

  switch (status) {
  case NrpeStatus::OK:
    return name;
  case NrpeStatus::MALFORMED_PACKET:
    return fmt::format("{}: expected {} bytes, got {}", name, expected, actual);
  case NrpeStatus::VERSION_MISMATCH:
    return fmt::format("{}: expected protocol version {} but got {}", name, expected, actual);
  case NrpeStatus::UNEXPECTED_PACKET_TYPE:
    return fmt::format("{}: expected packet type {} but got {}", name, expected, actual);
  case NrpeStatus::CHECKSUM_MISMATCH:
    return fmt::format("{}: expected CRC32 {:#010x} but got {:#010x}", name,
                       static_cast<std::uint32_t>(expected), static_cast<std::uint32_t>(actual));
  case NrpeStatus::COMMAND_TOO_LONG:
    return fmt::format("{}: {} bytes exceeds the {} byte payload", name, actual, expected);
  case NrpeStatus::CONNECT_ERROR:
  case NrpeStatus::TLS_ERROR:
  case NrpeStatus::TIMEOUT_ERROR:
  case NrpeStatus::IO_ERROR:
    break;
  }

  std::string out = name;
  if (!detail.empty()) {
    out += ": ";
    out += detail;
  }
  if (sysErrno != 0) {
    out += fmt::format(" ({})", std::strerror(sysErrno));
  }
  return out;
}

/* ----------------------------- NrpeResult Methods ----------------------------- */

std::string NrpeResult::toString() const {
  if (!ok()) {
    return error.toString();
  }
  return fmt::format("({}, '{}')", resultCode, message);
}

/* ----------------------------- API ----------------------------- */

ProtocolError buildQuery(std::string_view command, PacketBytes& out) noexcept {
  PacketFields fields{};
  fields.version = PROTOCOL_VERSION;
  fields.packetType = QUERY_PACKET;
  fields.resultCode = 0;
  fields.align1 = QUERY_ALIGN_1;
  fields.align2 = QUERY_ALIGN_2;
  return encodePacket(fields, command, out);
}

ProtocolError buildResponse(std::int16_t resultCode, std::string_view message,
                            PacketBytes& out) noexcept {
  PacketFields fields{};
  fields.version = PROTOCOL_VERSION;
  fields.packetType = RESPONSE_PACKET;
  fields.resultCode = resultCode;
  return encodePacket(fields, message, out);
}

std::string payloadToString(const PacketBuffer& buffer) {
  std::size_t len = buffer.size();
  while (len > 0 && buffer[len - 1] == 0) {
    --len;
  }
  return std::string(reinterpret_cast<const char*>(buffer.data()), len);
}

NrpeResult parseResponse(std::span<const std::uint8_t> bytes) {
  NrpeResult result{};

  PacketFields fields{};
  if (!decodeFields(bytes, fields)) {
    result.error = makeError(NrpeStatus::MALFORMED_PACKET, static_cast<std::int64_t>(PACKET_SIZE),
                             static_cast<std::int64_t>(bytes.size()));
    return result;
  }

  if (fields.version != PROTOCOL_VERSION) {
    result.error = makeError(NrpeStatus::VERSION_MISMATCH, PROTOCOL_VERSION, fields.version);
    return result;
  }

  if (fields.packetType != RESPONSE_PACKET) {
    result.error =
        makeError(NrpeStatus::UNEXPECTED_PACKET_TYPE, RESPONSE_PACKET, fields.packetType);
    return result;
  }

  const std::uint32_t EXPECTED_CRC = packetChecksum(fields);
  if (fields.crc32 != EXPECTED_CRC) {
    result.error = makeError(NrpeStatus::CHECKSUM_MISMATCH, EXPECTED_CRC, fields.crc32);
    return result;
  }

  result.resultCode = fields.resultCode;
  result.message = payloadToString(fields.buffer);
  return result;
}

} // namespace nrpe

} // namespace watchpost
