/**
 * @file Checksum.cpp
 * @brief Table-driven CRC-32 implementation.
 */

#include "src/nrpe/inc/Checksum.hpp"

#include <array> // std::array

namespace watchpost {

namespace nrpe {

namespace {

/* ----------------------------- Lookup Table ----------------------------- */

constexpr std::array<std::uint32_t, 256> makeCrcTable() noexcept {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t crc = i;
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc & 1U) ? (crc >> 1) ^ CRC32_POLYNOMIAL : (crc >> 1);
    }
    table[i] = crc;
  }
  return table;
}

constexpr std::array<std::uint32_t, 256> CRC_TABLE = makeCrcTable();

static_assert(CRC_TABLE[1] == 0x77073096U, "CRC-32 table generation broken");

} // namespace

/* ----------------------------- API ----------------------------- */

std::uint32_t crc32(std::span<const std::uint8_t> data) noexcept {
  std::uint32_t crc = 0xFFFFFFFFU;
  for (const std::uint8_t BYTE : data) {
    crc = CRC_TABLE[(crc ^ BYTE) & 0xFFU] ^ (crc >> 8);
  }
  return ~crc;
}

std::uint32_t packetChecksum(const PacketFields& fields) noexcept {
  PacketFields zeroed = fields;
  zeroed.crc32 = 0;
  const PacketBytes BYTES = encodeFields(zeroed);
  return crc32(BYTES);
}

} // namespace nrpe

} // namespace watchpost
