#ifndef WATCHPOST_NRPE_PACKET_LAYOUT_HPP
#define WATCHPOST_NRPE_PACKET_LAYOUT_HPP
/**
 * @file PacketLayout.hpp
 * @brief Fixed 1036-byte NRPE v2 packet layout.
 * @note Thread-safe: All functions are stateless.
 *
 * Every NRPE v2 message, query or response, is exactly PACKET_SIZE bytes on
 * the wire. There is no length prefix and no framing beyond the fixed size.
 *
 *   offset  size  field
 *   0       2     version      (int16, big-endian)
 *   2       2     packet type  (int16, big-endian)
 *   4       4     crc32        (int32, big-endian)
 *   8       2     result code  (int16, big-endian)
 *   10      1024  buffer       (null-padded payload)
 *   1034    1     align byte 1
 *   1035    1     align byte 2
 */

#include <array>   // std::array
#include <cstddef> // std::size_t, offsetof
#include <cstdint> // std::int16_t, std::uint32_t
#include <span>    // std::span

namespace watchpost {

namespace nrpe {

/* ----------------------------- Constants ----------------------------- */

/// Only protocol version spoken by this client.
inline constexpr std::int16_t PROTOCOL_VERSION = 2;

/// Packet type of a query sent to the daemon.
inline constexpr std::int16_t QUERY_PACKET = 1;

/// Packet type of the daemon's reply.
inline constexpr std::int16_t RESPONSE_PACKET = 2;

/// Payload capacity in bytes.
inline constexpr std::size_t BUFFER_SIZE = 1024;

/// Total wire size of one packet.
inline constexpr std::size_t PACKET_SIZE = 1036;

/// Alignment bytes written on every query.
inline constexpr std::uint8_t QUERY_ALIGN_1 = 'N';
inline constexpr std::uint8_t QUERY_ALIGN_2 = 'D';

/// One packet as raw wire bytes.
using PacketBytes = std::array<std::uint8_t, PACKET_SIZE>;

/// Payload storage.
using PacketBuffer = std::array<std::uint8_t, BUFFER_SIZE>;

/* ----------------------------- WirePacket ----------------------------- */

/**
 * @brief On-the-wire image of a packet. Multi-byte fields are network order.
 *
 * DO NOT reorder fields or change sizes: the layout is fixed by the daemon.
 */
#pragma pack(push, 1)
struct WirePacket {
  std::uint16_t version;
  std::uint16_t packetType;
  std::uint32_t crc32;
  std::uint16_t resultCode;
  PacketBuffer buffer;
  std::uint8_t align1;
  std::uint8_t align2;
};
#pragma pack(pop)

static_assert(sizeof(WirePacket) == PACKET_SIZE, "WirePacket size mismatch");
static_assert(offsetof(WirePacket, packetType) == 2, "packetType offset mismatch");
static_assert(offsetof(WirePacket, crc32) == 4, "crc32 offset mismatch");
static_assert(offsetof(WirePacket, resultCode) == 8, "resultCode offset mismatch");
static_assert(offsetof(WirePacket, buffer) == 10, "buffer offset mismatch");
static_assert(offsetof(WirePacket, align1) == 1034, "align1 offset mismatch");
static_assert(offsetof(WirePacket, align2) == 1035, "align2 offset mismatch");

/* ----------------------------- PacketFields ----------------------------- */

/**
 * @brief Host-order view of a packet.
 *
 * The checksum is kept unsigned; on the wire it occupies the same four bytes
 * as the signed int32 of the reference layout, so both readings compare equal
 * byte for byte.
 */
struct PacketFields {
  std::int16_t version{PROTOCOL_VERSION};
  std::int16_t packetType{QUERY_PACKET};
  std::uint32_t crc32{0};
  std::int16_t resultCode{0};
  PacketBuffer buffer{};
  std::uint8_t align1{0};
  std::uint8_t align2{0};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Serialize fields into the fixed wire layout.
 * @param fields Packet fields in host order.
 * @return Exactly PACKET_SIZE bytes.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] PacketBytes encodeFields(const PacketFields& fields) noexcept;

/**
 * @brief Unpack wire bytes into fields without any semantic validation.
 * @param bytes Received bytes.
 * @param out Populated on success, untouched on failure.
 * @return false if bytes is not exactly PACKET_SIZE long.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] bool decodeFields(std::span<const std::uint8_t> bytes, PacketFields& out) noexcept;

} // namespace nrpe

} // namespace watchpost

#endif // WATCHPOST_NRPE_PACKET_LAYOUT_HPP
