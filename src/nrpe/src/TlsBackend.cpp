/**
 * @file TlsBackend.cpp
 * @brief OpenSSL implementation of the NRPE TLS layer.
 * @note Requires OpenSSL >= 3.0 (SSL_OP_IGNORE_UNEXPECTED_EOF).
 */

#include "src/nrpe/inc/TlsBackend.hpp"

#include "src/nrpe/inc/Deadline.hpp"

#include <arpa/inet.h>  // inet_pton
#include <fcntl.h>      // fcntl, O_NONBLOCK
#include <netinet/in.h> // in6_addr
#include <poll.h>       // POLLIN, POLLOUT

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <cerrno>  // errno, EAGAIN, EWOULDBLOCK
#include <climits> // INT_MAX
#include <utility> // std::move

namespace watchpost {

namespace nrpe {

namespace {

/* ----------------------------- OpenSSL Handles ----------------------------- */

struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) const noexcept { SSL_CTX_free(ctx); }
};

struct SslDeleter {
  void operator()(SSL* ssl) const noexcept { SSL_free(ssl); }
};

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

/* ----------------------------- Error Helpers ----------------------------- */

/**
 * Drain the thread's OpenSSL error queue into one string.
 */
std::string drainErrorQueue() {
  std::string out;
  char buf[256];
  unsigned long code = 0;
  while ((code = ::ERR_get_error()) != 0) {
    ::ERR_error_string_n(code, buf, sizeof(buf));
    if (!out.empty()) {
      out += "; ";
    }
    out += buf;
  }
  return out;
}

ProtocolError tlsError(std::string_view what) {
  ProtocolError err{};
  err.status = NrpeStatus::TLS_ERROR;
  err.detail = std::string(what);
  const std::string QUEUE = drainErrorQueue();
  if (!QUEUE.empty()) {
    err.detail += ": " + QUEUE;
  }
  return err;
}

/**
 * Classify a failed SSL_connect/SSL_read/SSL_write.
 *
 * Reached for non-retryable errors, and on a blocking socket, where
 * WANT_READ/WANT_WRITE only surface when SO_RCVTIMEO/SO_SNDTIMEO expired.
 */
ProtocolError classifyFailure(SSL* ssl, int rc, int savedErrno, std::string_view op,
                              bool inHandshake) {
  const int SSL_ERR = ::SSL_get_error(ssl, rc);

  ProtocolError err{};

  if (SSL_ERR == SSL_ERROR_WANT_READ || SSL_ERR == SSL_ERROR_WANT_WRITE ||
      (SSL_ERR == SSL_ERROR_SYSCALL && (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK))) {
    err.status = NrpeStatus::TIMEOUT_ERROR;
    err.detail = std::string(op) + " timed out";
    err.sysErrno = EAGAIN;
    ::ERR_clear_error();
    return err;
  }

  err.detail = std::string(op) + " failed";
  if (SSL_ERR == SSL_ERROR_SYSCALL && !inHandshake) {
    err.status = NrpeStatus::IO_ERROR;
    err.sysErrno = savedErrno;
  } else {
    err.status = NrpeStatus::TLS_ERROR;
    err.sysErrno = (SSL_ERR == SSL_ERROR_SYSCALL) ? savedErrno : 0;
  }

  const std::string QUEUE = drainErrorQueue();
  if (!QUEUE.empty()) {
    err.detail += ": " + QUEUE;
  } else if (SSL_ERR == SSL_ERROR_SYSCALL && savedErrno == 0) {
    err.detail += ": connection closed by peer";
  }
  return err;
}

inline bool setNonBlocking(int fd) noexcept {
  const int FLAGS = ::fcntl(fd, F_GETFL, 0);
  return FLAGS >= 0 && ::fcntl(fd, F_SETFL, FLAGS | O_NONBLOCK) == 0;
}

/* ----------------------------- OpenSslBackend ----------------------------- */

class OpenSslBackend final : public TlsBackend {
public:
  OpenSslBackend(SslCtxPtr ctx, TlsMode mode) noexcept : ctx_(std::move(ctx)), mode_(mode) {}

  ~OpenSslBackend() override {
    // close_notify only on a healthy session.
    if (ssl_ && healthy_) {
      ::SSL_shutdown(ssl_.get());
    }
    ::ERR_clear_error();
  }

  OpenSslBackend(const OpenSslBackend&) = delete;
  OpenSslBackend& operator=(const OpenSslBackend&) = delete;

  ProtocolError handshake(int fd, const std::string& host,
                          std::chrono::milliseconds timeout) override {
    ::ERR_clear_error();
    fd_ = fd;
    timeout_ = timeout;

    ssl_.reset(::SSL_new(ctx_.get()));
    if (!ssl_) {
      return tlsError("SSL_new failed");
    }
    if (::SSL_set_fd(ssl_.get(), fd) != 1) {
      return tlsError("SSL_set_fd failed");
    }

    if (mode_ == TlsMode::VERIFIED) {
      ProtocolError err = configurePeerName(host);
      if (!err.ok()) {
        return err;
      }
    }

    // Bounded steps poll for readiness against a per-step deadline.
    if (timeout_.count() > 0 && !setNonBlocking(fd_)) {
      ProtocolError err{};
      err.status = NrpeStatus::TLS_ERROR;
      err.detail = "cannot switch socket to non-blocking";
      err.sysErrno = errno;
      return err;
    }

    const Deadline DEADLINE = Deadline::after(timeout_);
    for (;;) {
      const int RC = ::SSL_connect(ssl_.get());
      const int SAVED_ERRNO = errno;
      if (RC == 1) {
        break;
      }
      ProtocolError err{};
      if (!awaitRetry(RC, SAVED_ERRNO, DEADLINE, "TLS handshake", true, err)) {
        return err;
      }
    }

    healthy_ = true;
    return ProtocolError{};
  }

  ProtocolError writeAll(const std::uint8_t* data, std::size_t len) override {
    if (!healthy_ || len > static_cast<std::size_t>(INT_MAX)) {
      return tlsError("write on unusable TLS session");
    }

    const Deadline DEADLINE = Deadline::after(timeout_);
    for (;;) {
      ::ERR_clear_error();
      const int RC = ::SSL_write(ssl_.get(), data, static_cast<int>(len));
      const int SAVED_ERRNO = errno;
      if (RC > 0 && static_cast<std::size_t>(RC) == len) {
        return ProtocolError{};
      }

      if (RC > 0) {
        healthy_ = false;
        ProtocolError err{};
        err.status = NrpeStatus::IO_ERROR;
        err.detail = "short TLS write";
        err.expected = static_cast<std::int64_t>(len);
        err.actual = RC;
        return err;
      }

      ProtocolError err{};
      if (!awaitRetry(RC, SAVED_ERRNO, DEADLINE, "TLS write", false, err)) {
        healthy_ = false;
        return err;
      }
    }
  }

  ProtocolError readUpTo(std::uint8_t* data, std::size_t cap, std::size_t& received) override {
    received = 0;
    if (!healthy_ || cap > static_cast<std::size_t>(INT_MAX)) {
      return tlsError("read on unusable TLS session");
    }

    // One deadline for the whole reply. Buffered plaintext (SSL_pending) is
    // returned by SSL_read without waiting.
    const Deadline DEADLINE = Deadline::after(timeout_);
    while (received < cap) {
      ::ERR_clear_error();
      const int RC = ::SSL_read(ssl_.get(), data + received, static_cast<int>(cap - received));
      const int SAVED_ERRNO = errno;
      if (RC > 0) {
        received += static_cast<std::size_t>(RC);
        continue;
      }

      if (::SSL_get_error(ssl_.get(), RC) == SSL_ERROR_ZERO_RETURN) {
        break;
      }

      ProtocolError err{};
      if (!awaitRetry(RC, SAVED_ERRNO, DEADLINE, "TLS read", false, err)) {
        healthy_ = false;
        return err;
      }
    }

    return ProtocolError{};
  }

private:
  /**
   * Wait for the readiness the last SSL call asked for. Returns true to retry
   * the call; false with err set ends the step.
   */
  bool awaitRetry(int rc, int savedErrno, const Deadline& deadline, std::string_view op,
                  bool inHandshake, ProtocolError& err) {
    const int SSL_ERR = ::SSL_get_error(ssl_.get(), rc);
    if (!deadline.bounded() || (SSL_ERR != SSL_ERROR_WANT_READ && SSL_ERR != SSL_ERROR_WANT_WRITE)) {
      err = classifyFailure(ssl_.get(), rc, savedErrno, op, inHandshake);
      return false;
    }

    const int READY = waitFor(fd_, SSL_ERR == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
    if (READY > 0) {
      return true;
    }

    err = ProtocolError{};
    if (READY == 0) {
      err.status = NrpeStatus::TIMEOUT_ERROR;
      err.detail = std::string(op) + " timed out";
      err.sysErrno = ETIMEDOUT;
    } else {
      err.status = inHandshake ? NrpeStatus::TLS_ERROR : NrpeStatus::IO_ERROR;
      err.detail = std::string(op) + ": poll() failed";
      err.sysErrno = errno;
    }
    ::ERR_clear_error();
    return false;
  }

  ProtocolError configurePeerName(const std::string& host) {
    unsigned char addr[sizeof(struct in6_addr)];
    const bool IS_IP = ::inet_pton(AF_INET, host.c_str(), addr) == 1 ||
                       ::inet_pton(AF_INET6, host.c_str(), addr) == 1;

    if (IS_IP) {
      if (::X509_VERIFY_PARAM_set1_ip_asc(::SSL_get0_param(ssl_.get()), host.c_str()) != 1) {
        return tlsError("cannot set expected peer address");
      }
      return ProtocolError{};
    }

    if (::SSL_set_tlsext_host_name(ssl_.get(), host.c_str()) != 1) {
      return tlsError("cannot set SNI host name");
    }
    if (::SSL_set1_host(ssl_.get(), host.c_str()) != 1) {
      return tlsError("cannot set expected peer host name");
    }
    return ProtocolError{};
  }

  SslCtxPtr ctx_;
  SslPtr ssl_;
  TlsMode mode_;
  int fd_{-1};
  std::chrono::milliseconds timeout_{0};
  bool healthy_{false};
};

/* ----------------------------- Context Setup ----------------------------- */

ProtocolError configureAnonymousDh(SSL_CTX* ctx) {
  // aNULL suites do not exist in TLS 1.3.
  if (::SSL_CTX_set_min_proto_version(ctx, TLS1_VERSION) != 1 ||
      ::SSL_CTX_set_max_proto_version(ctx, TLS1_2_VERSION) != 1) {
    return tlsError("cannot restrict protocol versions");
  }
  if (::SSL_CTX_set_cipher_list(ctx, ANONYMOUS_DH_CIPHERS) != 1) {
    return tlsError("anonymous DH cipher suites unavailable");
  }
  ::SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
  return ProtocolError{};
}

ProtocolError configureVerified(SSL_CTX* ctx, const TlsConfig& config) {
  if (::SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION) != 1) {
    return tlsError("cannot restrict protocol versions");
  }

  ::SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);

  if (config.caFile.empty()) {
    if (::SSL_CTX_set_default_verify_paths(ctx) != 1) {
      return tlsError("cannot load system CA store");
    }
  } else if (::SSL_CTX_load_verify_locations(ctx, config.caFile.c_str(), nullptr) != 1) {
    return tlsError("cannot load CA file " + config.caFile);
  }

  if (config.certFile.empty()) {
    return ProtocolError{};
  }

  const std::string& keyFile = config.keyFile.empty() ? config.certFile : config.keyFile;
  if (::SSL_CTX_use_certificate_chain_file(ctx, config.certFile.c_str()) != 1) {
    return tlsError("cannot load client certificate " + config.certFile);
  }
  if (::SSL_CTX_use_PrivateKey_file(ctx, keyFile.c_str(), SSL_FILETYPE_PEM) != 1) {
    return tlsError("cannot load client key " + keyFile);
  }
  if (::SSL_CTX_check_private_key(ctx) != 1) {
    return tlsError("client key does not match certificate");
  }
  return ProtocolError{};
}

} // namespace

/* ----------------------------- TlsMode Helpers ----------------------------- */

const char* toString(TlsMode mode) noexcept {
  switch (mode) {
  case TlsMode::NONE:
    return "none";
  case TlsMode::ANONYMOUS_DH:
    return "adh";
  case TlsMode::VERIFIED:
    return "verify";
  }
  return "unknown";
}

bool parseTlsMode(std::string_view text, TlsMode& out) noexcept {
  if (text == "none") {
    out = TlsMode::NONE;
  } else if (text == "adh") {
    out = TlsMode::ANONYMOUS_DH;
  } else if (text == "verify") {
    out = TlsMode::VERIFIED;
  } else {
    return false;
  }
  return true;
}

/* ----------------------------- API ----------------------------- */

std::unique_ptr<TlsBackend> makeOpenSslBackend(const TlsConfig& config, ProtocolError& err) {
  err = ProtocolError{};
  ::ERR_clear_error();

  if (config.mode == TlsMode::NONE) {
    err.status = NrpeStatus::TLS_ERROR;
    err.detail = "TLS backend requested for plain TCP";
    return nullptr;
  }

  SslCtxPtr ctx(::SSL_CTX_new(::TLS_client_method()));
  if (!ctx) {
    err = tlsError("SSL_CTX_new failed");
    return nullptr;
  }

  ::SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);

  err = (config.mode == TlsMode::ANONYMOUS_DH) ? configureAnonymousDh(ctx.get())
                                              : configureVerified(ctx.get(), config);
  if (!err.ok()) {
    return nullptr;
  }

  return std::make_unique<OpenSslBackend>(std::move(ctx), config.mode);
}

} // namespace nrpe

} // namespace watchpost
