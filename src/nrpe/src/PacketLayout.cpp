/**
 * @file PacketLayout.cpp
 * @brief Wire image conversion for NRPE packets.
 */

#include "src/nrpe/inc/PacketLayout.hpp"

#include <arpa/inet.h> // htons, htonl, ntohs, ntohl

#include <cstring> // std::memcpy

namespace watchpost {

namespace nrpe {

PacketBytes encodeFields(const PacketFields& fields) noexcept {
  WirePacket wire{};
  wire.version = htons(static_cast<std::uint16_t>(fields.version));
  wire.packetType = htons(static_cast<std::uint16_t>(fields.packetType));
  wire.crc32 = htonl(fields.crc32);
  wire.resultCode = htons(static_cast<std::uint16_t>(fields.resultCode));
  wire.buffer = fields.buffer;
  wire.align1 = fields.align1;
  wire.align2 = fields.align2;

  PacketBytes bytes{};
  std::memcpy(bytes.data(), &wire, sizeof(wire));
  return bytes;
}

bool decodeFields(std::span<const std::uint8_t> bytes, PacketFields& out) noexcept {
  if (bytes.size() != PACKET_SIZE) {
    return false;
  }

  WirePacket wire{};
  std::memcpy(&wire, bytes.data(), sizeof(wire));

  out.version = static_cast<std::int16_t>(ntohs(wire.version));
  out.packetType = static_cast<std::int16_t>(ntohs(wire.packetType));
  out.crc32 = ntohl(wire.crc32);
  out.resultCode = static_cast<std::int16_t>(ntohs(wire.resultCode));
  out.buffer = wire.buffer;
  out.align1 = wire.align1;
  out.align2 = wire.align2;
  return true;
}

} // namespace nrpe

} // namespace watchpost
