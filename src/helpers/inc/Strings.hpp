#ifndef WATCHPOST_HELPERS_STRINGS_HPP
#define WATCHPOST_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String parsing and escaping helpers for CLI tools.
 *
 * @note Parsing functions are noexcept and allocation-free; escapeJson()
 *       returns std::string and is cold-path only.
 */

#include <chrono>       // std::chrono::milliseconds
#include <cmath>        // std::isfinite
#include <cstdint>      // std::uint16_t
#include <cstdlib>      // std::strtod
#include <charconv>     // std::from_chars
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::errc

#include <fmt/core.h>

namespace watchpost {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse a TCP port number (1-65535).
 * @param text Decimal digits only.
 * @param out Set on success.
 * @return false on empty, non-numeric, trailing garbage or out-of-range input.
 */
[[nodiscard]] inline bool parsePort(std::string_view text, std::uint16_t& out) noexcept {
  unsigned int value = 0;
  const char* const END = text.data() + text.size();
  const auto RES = std::from_chars(text.data(), END, value);
  if (text.empty() || RES.ec != std::errc{} || RES.ptr != END || value == 0 || value > 65535) {
    return false;
  }
  out = static_cast<std::uint16_t>(value);
  return true;
}

/**
 * @brief Parse a non-negative duration in (possibly fractional) seconds.
 * @param text e.g. "10", "2.5".
 * @param out Set on success, rounded to whole milliseconds. Any positive
 *        value yields at least 1 ms.
 * @return false on malformed, negative or non-finite input.
 */
[[nodiscard]] inline bool parseSeconds(std::string_view text,
                                       std::chrono::milliseconds& out) noexcept {
  // strtod needs a terminated buffer; reject anything unreasonably long.
  char buf[32];
  if (text.empty() || text.size() >= sizeof(buf)) {
    return false;
  }
  text.copy(buf, text.size());
  buf[text.size()] = '\0';

  char* end = nullptr;
  const double SECONDS = std::strtod(buf, &end);
  if (end != buf + text.size() || !std::isfinite(SECONDS) || SECONDS < 0.0 ||
      SECONDS > 86400.0) {
    return false;
  }

  long long ms = static_cast<long long>(SECONDS * 1000.0 + 0.5);
  // 0 means "no timeout"; a positive request must stay bounded.
  if (ms == 0 && SECONDS > 0.0) {
    ms = 1;
  }
  out = std::chrono::milliseconds(ms);
  return true;
}

/* ----------------------------- Escaping ----------------------------- */

/**
 * @brief Escape text for embedding in a JSON string literal.
 * @note NOT RT-safe: Returns std::string.
 */
[[nodiscard]] inline std::string escapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (const char C : text) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(C)));
      } else {
        out.push_back(C);
      }
      break;
    }
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace watchpost

#endif // WATCHPOST_HELPERS_STRINGS_HPP
