#ifndef WATCHPOST_NRPE_CHECKSUM_HPP
#define WATCHPOST_NRPE_CHECKSUM_HPP
/**
 * @file Checksum.hpp
 * @brief CRC-32 (ISO-HDLC) packet checksum.
 * @note Thread-safe: Pure functions over caller-owned data.
 *
 * Same algorithm as zlib's crc32(): reflected polynomial 0xEDB88320,
 * initial value 0xFFFFFFFF, final XOR 0xFFFFFFFF.
 */

#include "src/nrpe/inc/PacketLayout.hpp"

#include <cstdint> // std::uint32_t
#include <span>    // std::span

namespace watchpost {

namespace nrpe {

/* ----------------------------- Constants ----------------------------- */

/// Reflected CRC-32 polynomial.
inline constexpr std::uint32_t CRC32_POLYNOMIAL = 0xEDB88320U;

/* ----------------------------- API ----------------------------- */

/**
 * @brief CRC-32 over an arbitrary byte range.
 * @param data Bytes to checksum.
 * @return CRC-32 value.
 * @note RT-safe: Table lookup, no allocation.
 */
[[nodiscard]] std::uint32_t crc32(std::span<const std::uint8_t> data) noexcept;

/**
 * @brief Checksum of a packet as the daemon computes it.
 * @param fields Packet fields; the crc32 member is ignored and treated as 0.
 * @return CRC-32 of the full 1036-byte image with the checksum field zeroed.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] std::uint32_t packetChecksum(const PacketFields& fields) noexcept;

} // namespace nrpe

} // namespace watchpost

#endif // WATCHPOST_NRPE_CHECKSUM_HPP
