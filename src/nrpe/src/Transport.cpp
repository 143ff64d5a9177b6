/**
 * @file Transport.cpp
 * @brief Blocking TCP/TLS exchange for NRPE.
 */

#include "src/nrpe/inc/Transport.hpp"

#include "src/nrpe/inc/Deadline.hpp"

#include <fcntl.h>      // fcntl, O_NONBLOCK
#include <netdb.h>      // getaddrinfo, gai_strerror
#include <poll.h>       // POLLIN, POLLOUT
#include <sys/socket.h> // socket, connect, send, recv
#include <sys/time.h>   // timeval
#include <unistd.h>     // close

#include <cerrno>  // errno
#include <memory>  // std::unique_ptr
#include <utility> // std::move

#include <fmt/core.h>

namespace watchpost {

namespace nrpe {

namespace {

/* ----------------------------- Helpers ----------------------------- */

struct AddrInfoDeleter {
  void operator()(struct addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};

using AddrInfoPtr = std::unique_ptr<struct addrinfo, AddrInfoDeleter>;

ProtocolError sysError(NrpeStatus status, std::string_view what, int savedErrno) {
  ProtocolError err{};
  err.status = status;
  err.detail = std::string(what);
  err.sysErrno = savedErrno;
  return err;
}

inline bool isTimeoutErrno(int e) noexcept { return e == EAGAIN || e == EWOULDBLOCK; }

inline bool setBlocking(int fd, bool blocking) noexcept {
  const int FLAGS = ::fcntl(fd, F_GETFL, 0);
  if (FLAGS < 0) {
    return false;
  }
  const int NEW_FLAGS = blocking ? (FLAGS & ~O_NONBLOCK) : (FLAGS | O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, NEW_FLAGS) == 0;
}

/**
 * Bound each send/recv syscall on fd. Step deadlines are enforced separately.
 */
inline bool setIoTimeout(int fd, std::chrono::milliseconds timeout) noexcept {
  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

/* ----------------------------- Connect ----------------------------- */

ProtocolError connectOne(const struct addrinfo* ai, std::chrono::milliseconds timeout,
                         SocketHandle& out) {
  SocketHandle sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
  if (!sock.isOpen()) {
    return sysError(NrpeStatus::CONNECT_ERROR, "socket() failed", errno);
  }

  const bool BOUNDED = timeout.count() > 0;

  if (!BOUNDED) {
    if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) != 0) {
      return sysError(NrpeStatus::CONNECT_ERROR, "connect() failed", errno);
    }
    out = std::move(sock);
    return ProtocolError{};
  }

  if (!setBlocking(sock.get(), false)) {
    return sysError(NrpeStatus::CONNECT_ERROR, "fcntl() failed", errno);
  }

  if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) != 0) {
    if (errno != EINPROGRESS) {
      return sysError(NrpeStatus::CONNECT_ERROR, "connect() failed", errno);
    }

    const int RC = waitFor(sock.get(), POLLOUT, Deadline::after(timeout));
    if (RC == 0) {
      return sysError(NrpeStatus::TIMEOUT_ERROR, "connect timed out", ETIMEDOUT);
    }
    if (RC < 0) {
      return sysError(NrpeStatus::CONNECT_ERROR, "poll() failed", errno);
    }

    int soError = 0;
    socklen_t len = sizeof(soError);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
      return sysError(NrpeStatus::CONNECT_ERROR, "getsockopt() failed", errno);
    }
    if (soError != 0) {
      return sysError(NrpeStatus::CONNECT_ERROR, "connect() failed", soError);
    }
  }

  if (!setBlocking(sock.get(), true) || !setIoTimeout(sock.get(), timeout)) {
    return sysError(NrpeStatus::CONNECT_ERROR, "cannot configure socket", errno);
  }

  out = std::move(sock);
  return ProtocolError{};
}

/**
 * Resolve host and connect to the first address that accepts.
 * A timeout ends the attempt immediately instead of trying further addresses.
 */
ProtocolError connectTcp(const TransportConfig& config, SocketHandle& out) {
  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_NUMERICSERV;

  const std::string SERVICE = std::to_string(config.port);
  struct addrinfo* raw = nullptr;
  const int GAI = ::getaddrinfo(config.host.c_str(), SERVICE.c_str(), &hints, &raw);
  if (GAI != 0) {
    ProtocolError err{};
    err.status = NrpeStatus::CONNECT_ERROR;
    err.detail = fmt::format("cannot resolve {}: {}", config.host, ::gai_strerror(GAI));
    err.sysErrno = (GAI == EAI_SYSTEM) ? errno : 0;
    return err;
  }
  const AddrInfoPtr ADDRS(raw);

  ProtocolError last = sysError(NrpeStatus::CONNECT_ERROR, "no usable address", 0);
  for (const struct addrinfo* ai = ADDRS.get(); ai != nullptr; ai = ai->ai_next) {
    last = connectOne(ai, config.timeout, out);
    if (last.ok() || last.status == NrpeStatus::TIMEOUT_ERROR) {
      break;
    }
  }

  if (!last.ok()) {
    last.detail = fmt::format("{}:{}: {}", config.host, config.port, last.detail);
  }
  return last;
}

/* ----------------------------- Plain Stream I/O ----------------------------- */

ProtocolError sendPlain(int fd, const PacketBytes& query) {
  ssize_t n = 0;
  do {
    n = ::send(fd, query.data(), query.size(), MSG_NOSIGNAL);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    const int SAVED = errno;
    return isTimeoutErrno(SAVED) ? sysError(NrpeStatus::TIMEOUT_ERROR, "send timed out", SAVED)
                                 : sysError(NrpeStatus::IO_ERROR, "send() failed", SAVED);
  }

  if (static_cast<std::size_t>(n) != query.size()) {
    ProtocolError err = sysError(NrpeStatus::IO_ERROR, "short write", 0);
    err.expected = static_cast<std::int64_t>(query.size());
    err.actual = n;
    return err;
  }
  return ProtocolError{};
}

/**
 * Read until cap bytes or EOF. The whole loop shares one deadline, so the
 * step ends on time however the peer splits its reply.
 */
ProtocolError receivePlain(int fd, std::chrono::milliseconds timeout, std::uint8_t* data,
                           std::size_t cap, std::size_t& received) {
  const Deadline DEADLINE = Deadline::after(timeout);
  received = 0;
  while (received < cap) {
    if (DEADLINE.bounded()) {
      const int READY = waitFor(fd, POLLIN, DEADLINE);
      if (READY == 0) {
        return sysError(NrpeStatus::TIMEOUT_ERROR, "receive timed out", ETIMEDOUT);
      }
      if (READY < 0) {
        return sysError(NrpeStatus::IO_ERROR, "poll() failed", errno);
      }
    }

    const ssize_t N = ::recv(fd, data + received, cap - received, 0);
    if (N > 0) {
      received += static_cast<std::size_t>(N);
      continue;
    }
    if (N == 0) {
      break;
    }

    const int SAVED = errno;
    if (SAVED == EINTR) {
      continue;
    }
    return isTimeoutErrno(SAVED) ? sysError(NrpeStatus::TIMEOUT_ERROR, "receive timed out", SAVED)
                                 : sysError(NrpeStatus::IO_ERROR, "recv() failed", SAVED);
  }
  return ProtocolError{};
}

} // namespace

/* ----------------------------- SocketHandle Methods ----------------------------- */

void SocketHandle::reset(int fd) noexcept {
  if (fd_ >= 0 && fd_ != fd) {
    ::close(fd_);
  }
  fd_ = fd;
}

/* ----------------------------- API ----------------------------- */

ProtocolError connectAndExchange(const TransportConfig& config, const PacketBytes& query,
                                 std::vector<std::uint8_t>& response) {
  response.clear();

  SocketHandle sock;
  ProtocolError err = connectTcp(config, sock);
  if (!err.ok()) {
    return err;
  }

  std::vector<std::uint8_t> buf(PACKET_SIZE);
  std::size_t received = 0;

  if (config.tls.mode == TlsMode::NONE) {
    err = sendPlain(sock.get(), query);
    if (err.ok()) {
      err = receivePlain(sock.get(), config.timeout, buf.data(), buf.size(), received);
    }
  } else {
    // Declared after sock so the session shuts down before the descriptor closes.
    const std::unique_ptr<TlsBackend> TLS = makeOpenSslBackend(config.tls, err);
    if (!TLS) {
      return err;
    }
    err = TLS->handshake(sock.get(), config.host, config.timeout);
    if (err.ok()) {
      err = TLS->writeAll(query.data(), query.size());
    }
    if (err.ok()) {
      err = TLS->readUpTo(buf.data(), buf.size(), received);
    }
  }

  if (!err.ok()) {
    return err;
  }

  buf.resize(received);
  response = std::move(buf);
  return ProtocolError{};
}

} // namespace nrpe

} // namespace watchpost
