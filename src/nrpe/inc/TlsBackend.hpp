#ifndef WATCHPOST_NRPE_TLS_BACKEND_HPP
#define WATCHPOST_NRPE_TLS_BACKEND_HPP
/**
 * @file TlsBackend.hpp
 * @brief TLS layer for a single NRPE exchange.
 * @note Linux-only. OpenSSL 3.x backend.
 * @note Thread-safe: Each backend instance owns one connection and is used
 *       by one thread. Separate instances share nothing.
 *
 * @warning TlsMode::ANONYMOUS_DH negotiates an anonymous Diffie-Hellman
 *          suite with no certificates on either side. It exists only for wire
 *          compatibility with legacy NRPE daemons and offers no protection
 *          against an active man-in-the-middle. Prefer TlsMode::VERIFIED when
 *          both ends are under your control.
 */

#include "src/nrpe/inc/Packet.hpp"

#include <chrono>      // std::chrono::milliseconds
#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <memory>      // std::unique_ptr
#include <string>      // std::string
#include <string_view> // std::string_view

namespace watchpost {

namespace nrpe {

/* ----------------------------- TlsMode ----------------------------- */

/**
 * @brief How the TCP stream is wrapped.
 */
enum class TlsMode : std::uint8_t {
  NONE = 0,     ///< Plain TCP (daemon started with -n)
  ANONYMOUS_DH, ///< Legacy NRPE default: ADH cipher, no certificates
  VERIFIED,     ///< Certificate-verified TLS, optionally mutual
};

/**
 * @brief Human-readable mode string ("none", "adh", "verify").
 * @note RT-safe: Returns static string pointer.
 */
[[nodiscard]] const char* toString(TlsMode mode) noexcept;

/**
 * @brief Parse a mode string as accepted by toString().
 * @param text Mode name.
 * @param out Set on success.
 * @return false for an unrecognized name.
 */
[[nodiscard]] bool parseTlsMode(std::string_view text, TlsMode& out) noexcept;

/* ----------------------------- Constants ----------------------------- */

/// Cipher list for ANONYMOUS_DH. Security level 0 is required for aNULL suites.
inline constexpr const char* ANONYMOUS_DH_CIPHERS = "ADH:@SECLEVEL=0";

/* ----------------------------- TlsConfig ----------------------------- */

/**
 * @brief TLS settings. File paths are only consulted in VERIFIED mode.
 */
struct TlsConfig {
  TlsMode mode{TlsMode::ANONYMOUS_DH};
  std::string caFile;   ///< CA bundle for server verification; empty = system store
  std::string certFile; ///< Client certificate (PEM) for mutual TLS; empty = none
  std::string keyFile;  ///< Client private key (PEM); defaults to certFile when empty
};

/* ----------------------------- TlsBackend ----------------------------- */

/**
 * @brief TLS session over an already connected socket.
 *
 * The backend never owns the socket descriptor; the caller closes it after
 * the backend is destroyed. Destruction sends close_notify when the session
 * is still healthy and releases all TLS state.
 */
class TlsBackend {
public:
  virtual ~TlsBackend() = default;

  /**
   * @brief Run the client handshake on fd. host is used for SNI and name checks.
   * @param timeout Bound for this and each later step (handshake, write, read);
   *        0 = block indefinitely. A bounded backend switches fd to non-blocking.
   */
  [[nodiscard]] virtual ProtocolError handshake(int fd, const std::string& host,
                                                std::chrono::milliseconds timeout) = 0;

  /// @brief Write len bytes as one record. A partial write is an IO_ERROR.
  [[nodiscard]] virtual ProtocolError writeAll(const std::uint8_t* data, std::size_t len) = 0;

  /// @brief Read until cap bytes arrive or the peer closes, within one step deadline.
  [[nodiscard]] virtual ProtocolError readUpTo(std::uint8_t* data, std::size_t cap,
                                               std::size_t& received) = 0;
};

/**
 * @brief Create the OpenSSL backend for the given configuration.
 * @param config TLS settings; mode must not be NONE.
 * @param err TLS_ERROR with OpenSSL detail when context setup fails.
 * @return Backend, or nullptr on failure.
 * @note NOT RT-safe: Allocates TLS context.
 */
[[nodiscard]] std::unique_ptr<TlsBackend> makeOpenSslBackend(const TlsConfig& config,
                                                             ProtocolError& err);

} // namespace nrpe

} // namespace watchpost

#endif // WATCHPOST_NRPE_TLS_BACKEND_HPP
