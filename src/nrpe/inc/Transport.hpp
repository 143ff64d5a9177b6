#ifndef WATCHPOST_NRPE_TRANSPORT_HPP
#define WATCHPOST_NRPE_TRANSPORT_HPP
/**
 * @file Transport.hpp
 * @brief One blocking NRPE request/response exchange over TCP or TLS.
 * @note Linux-only. Uses POSIX sockets and getaddrinfo.
 * @note Thread-safe: No shared state; concurrent exchanges each own their socket.
 *
 * Sequence: resolve -> connect -> [TLS handshake] -> send -> receive -> close.
 * The timeout bounds each blocking step separately. The socket and any TLS
 * session are released on every return path.
 *
 * @warning NOT RT-safe: Blocking network I/O and allocation.
 */

#include "src/nrpe/inc/Packet.hpp"
#include "src/nrpe/inc/TlsBackend.hpp"

#include <chrono>  // std::chrono::milliseconds
#include <cstdint> // std::uint16_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace watchpost {

namespace nrpe {

/* ----------------------------- Constants ----------------------------- */

/// Port the NRPE daemon listens on by default.
inline constexpr std::uint16_t DEFAULT_PORT = 5666;

/* ----------------------------- SocketHandle ----------------------------- */

/**
 * @brief Owning wrapper around a socket descriptor. Move-only.
 */
class SocketHandle {
public:
  SocketHandle() noexcept = default;
  explicit SocketHandle(int fd) noexcept : fd_(fd) {}
  ~SocketHandle() { reset(); }

  SocketHandle(const SocketHandle&) = delete;
  SocketHandle& operator=(const SocketHandle&) = delete;

  SocketHandle(SocketHandle&& other) noexcept : fd_(other.release()) {}
  SocketHandle& operator=(SocketHandle&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

  /// @brief Give up ownership without closing.
  [[nodiscard]] int release() noexcept {
    const int FD = fd_;
    fd_ = -1;
    return FD;
  }

  /// @brief Close the current descriptor (if any) and adopt fd.
  void reset(int fd = -1) noexcept;

private:
  int fd_{-1};
};

/* ----------------------------- TransportConfig ----------------------------- */

/**
 * @brief Where and how to connect.
 */
struct TransportConfig {
  std::string host;                     ///< Host name or IPv4/IPv6 literal
  std::uint16_t port{DEFAULT_PORT};     ///< TCP port
  TlsConfig tls{};                      ///< Stream wrapping
  std::chrono::milliseconds timeout{0}; ///< Per-step bound; 0 = block indefinitely
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Connect, send one packet, and read one packet back.
 * @param config Target and transport settings.
 * @param query Exactly one packet, sent in a single write.
 * @param response Receives whatever arrived, at most PACKET_SIZE bytes. A short
 *        read at end of stream is returned as-is so the codec can reject it.
 * @return OK, CONNECT_ERROR, TLS_ERROR, TIMEOUT_ERROR or IO_ERROR.
 * @note NOT RT-safe: Blocking I/O.
 */
[[nodiscard]] ProtocolError connectAndExchange(const TransportConfig& config,
                                               const PacketBytes& query,
                                               std::vector<std::uint8_t>& response);

} // namespace nrpe

} // namespace watchpost

#endif // WATCHPOST_NRPE_TRANSPORT_HPP
