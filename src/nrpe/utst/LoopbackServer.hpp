#ifndef WATCHPOST_NRPE_UTST_LOOPBACK_SERVER_HPP
#define WATCHPOST_NRPE_UTST_LOOPBACK_SERVER_HPP
/**
 * @file LoopbackServer.hpp
 * @brief Single-connection fake NRPE daemon on 127.0.0.1 for unit tests.
 *
 * Binds an ephemeral port, accepts exactly one connection on a background
 * thread and hands the accepted descriptor to a handler. The destructor wakes
 * a pending accept and joins the thread.
 *
 * Also provides canned handlers (plain and TLS replies, byte-at-a-time
 * trickles) and TestCertificate, a generated self-signed certificate for
 * certificate-verified TLS.
 */

#include "src/nrpe/inc/PacketLayout.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <pthread.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace watchpost {
namespace nrpe {
namespace test {

class LoopbackServer {
public:
  using Handler = std::function<void(int fd)>;

  explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
    listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0) {
      return;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    socklen_t len = sizeof(addr);
    if (::bind(listenFd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listenFd_, 1) != 0 ||
        ::getsockname(listenFd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
      ::close(listenFd_);
      listenFd_ = -1;
      return;
    }

    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this]() { run(); });
  }

  ~LoopbackServer() {
    if (listenFd_ >= 0) {
      ::shutdown(listenFd_, SHUT_RDWR);
    }
    if (thread_.joinable()) {
      thread_.join();
    }
    if (listenFd_ >= 0) {
      ::close(listenFd_);
    }
  }

  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  [[nodiscard]] bool ready() const noexcept { return listenFd_ >= 0; }
  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

  /// @brief True once the handler has returned.
  [[nodiscard]] bool done() const noexcept { return done_.load(); }

private:
  void run() {
    // Writes to a client that already left report EPIPE instead of killing the suite.
    sigset_t pipeOnly;
    sigemptyset(&pipeOnly);
    sigaddset(&pipeOnly, SIGPIPE);
    ::pthread_sigmask(SIG_BLOCK, &pipeOnly, nullptr);

    const int CLIENT = ::accept(listenFd_, nullptr, nullptr);
    if (CLIENT >= 0) {
      // Never let a misbehaving test hang the suite.
      struct timeval tv{};
      tv.tv_sec = 5;
      ::setsockopt(CLIENT, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
      ::setsockopt(CLIENT, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
      handler_(CLIENT);
      ::close(CLIENT);
    }
    done_.store(true);
  }

  Handler handler_;
  int listenFd_{-1};
  std::uint16_t port_{0};
  std::atomic<bool> done_{false};
  std::thread thread_;
};

/* ----------------------------- Plain Handlers ----------------------------- */

/// Read one full query packet. Returns bytes read.
inline std::size_t readQuery(int fd, PacketBytes& query) {
  std::size_t got = 0;
  while (got < query.size()) {
    const ssize_t N = ::recv(fd, query.data() + got, query.size() - got, 0);
    if (N <= 0) {
      break;
    }
    got += static_cast<std::size_t>(N);
  }
  return got;
}

/// Block until the peer closes its end (recv returns 0). False on timeout/error.
inline bool waitForPeerClose(int fd) {
  std::uint8_t buf[64];
  for (;;) {
    const ssize_t N = ::recv(fd, buf, sizeof(buf), 0);
    if (N == 0) {
      return true;
    }
    if (N < 0) {
      return false;
    }
  }
}

/// Handler: read the query, then send raw bytes back.
inline LoopbackServer::Handler replyWith(std::vector<std::uint8_t> reply,
                                         PacketBytes* capturedQuery = nullptr) {
  return [reply = std::move(reply), capturedQuery](int fd) {
    PacketBytes query{};
    readQuery(fd, query);
    if (capturedQuery != nullptr) {
      *capturedQuery = query;
    }
    if (!reply.empty()) {
      ::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL);
    }
  };
}

/* ----------------------------- TLS Handler ----------------------------- */

/**
 * @brief Create an anonymous-DH server context like a legacy NRPE daemon.
 * @return nullptr if the local OpenSSL build cannot offer ADH suites.
 */
inline SSL_CTX* makeAnonymousDhServerContext() {
  SSL_CTX* ctx = ::SSL_CTX_new(::TLS_server_method());
  if (ctx == nullptr) {
    return nullptr;
  }
  if (::SSL_CTX_set_max_proto_version(ctx, TLS1_2_VERSION) != 1 ||
      ::SSL_CTX_set_cipher_list(ctx, "ADH:@SECLEVEL=0") != 1 ||
      ::SSL_CTX_set_dh_auto(ctx, 1) != 1) {
    ::SSL_CTX_free(ctx);
    ::ERR_clear_error();
    return nullptr;
  }
  return ctx;
}

/// Handler: TLS accept with ctx, read the query, write reply.
inline LoopbackServer::Handler tlsReplyWith(SSL_CTX* ctx, std::vector<std::uint8_t> reply) {
  return [ctx, reply = std::move(reply)](int fd) {
    SSL* ssl = ::SSL_new(ctx);
    if (ssl == nullptr) {
      return;
    }
    ::SSL_set_fd(ssl, fd);
    if (::SSL_accept(ssl) == 1) {
      PacketBytes query{};
      std::size_t got = 0;
      while (got < query.size()) {
        const int N = ::SSL_read(ssl, query.data() + got, static_cast<int>(query.size() - got));
        if (N <= 0) {
          break;
        }
        got += static_cast<std::size_t>(N);
      }
      ::SSL_write(ssl, reply.data(), static_cast<int>(reply.size()));
      ::SSL_shutdown(ssl);
    }
    ::SSL_free(ssl);
    ::ERR_clear_error();
  };
}

/* ----------------------------- Slow Peers ----------------------------- */

/// True while the client end is still connected (no EOF or reset pending).
inline bool peerStillOpen(int fd) {
  std::uint8_t peek = 0;
  const ssize_t N = ::recv(fd, &peek, 1, MSG_PEEK | MSG_DONTWAIT);
  return N > 0 || (N < 0 && (errno == EAGAIN || errno == EWOULDBLOCK));
}

/// Handler: read the query, then send count bytes one at a time, interval apart.
inline LoopbackServer::Handler trickleBytes(int count, std::chrono::milliseconds interval) {
  return [count, interval](int fd) {
    PacketBytes query{};
    readQuery(fd, query);
    const std::uint8_t BYTE = 0;
    for (int i = 0; i < count && peerStillOpen(fd); ++i) {
      if (::send(fd, &BYTE, 1, MSG_NOSIGNAL) != 1) {
        return;
      }
      std::this_thread::sleep_for(interval);
    }
  };
}

/// Handler: TLS accept, read the query, then send count one-byte records.
inline LoopbackServer::Handler tlsTrickleBytes(SSL_CTX* ctx, int count,
                                               std::chrono::milliseconds interval) {
  return [ctx, count, interval](int fd) {
    SSL* ssl = ::SSL_new(ctx);
    if (ssl == nullptr) {
      return;
    }
    ::SSL_set_fd(ssl, fd);
    if (::SSL_accept(ssl) == 1) {
      PacketBytes query{};
      std::size_t got = 0;
      while (got < query.size()) {
        const int N = ::SSL_read(ssl, query.data() + got, static_cast<int>(query.size() - got));
        if (N <= 0) {
          break;
        }
        got += static_cast<std::size_t>(N);
      }
      const std::uint8_t BYTE = 0;
      for (int i = 0; i < count && peerStillOpen(fd); ++i) {
        if (::SSL_write(ssl, &BYTE, 1) != 1) {
          break;
        }
        std::this_thread::sleep_for(interval);
      }
    }
    ::SSL_free(ssl);
    ::ERR_clear_error();
  };
}

/* ----------------------------- Certificates ----------------------------- */

/**
 * @brief Self-signed EC certificate for one DNS name.
 *
 * The certificate is also written to a temporary PEM file so it can serve as
 * the client's CA bundle. The file is removed on destruction.
 */
class TestCertificate {
public:
  explicit TestCertificate(const std::string& dnsName) {
    key_ = EVP_EC_gen("P-256");
    cert_ = ::X509_new();
    if (key_ == nullptr || cert_ == nullptr) {
      return;
    }

    ::X509_set_version(cert_, 2);
    ::ASN1_INTEGER_set(::X509_get_serialNumber(cert_), 1);
    ::X509_gmtime_adj(::X509_getm_notBefore(cert_), -3600);
    ::X509_gmtime_adj(::X509_getm_notAfter(cert_), 86400);
    ::X509_set_pubkey(cert_, key_);

    X509_NAME* name = ::X509_get_subject_name(cert_);
    ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                 reinterpret_cast<const unsigned char*>(dnsName.c_str()), -1,
                                 -1, 0);
    ::X509_set_issuer_name(cert_, name);

    if (!addExtension(NID_basic_constraints, "critical,CA:TRUE") ||
        !addExtension(NID_subject_alt_name, "DNS:" + dnsName) ||
        ::X509_sign(cert_, key_, ::EVP_sha256()) <= 0) {
      return;
    }

    char path[] = "/tmp/watchpost-cert-XXXXXX";
    const int FD = ::mkstemp(path);
    if (FD < 0) {
      return;
    }
    pemPath_ = path;
    std::FILE* out = ::fdopen(FD, "w");
    if (out == nullptr) {
      ::close(FD);
      return;
    }
    ready_ = ::PEM_write_X509(out, cert_) == 1;
    ready_ = (std::fclose(out) == 0) && ready_;
  }

  ~TestCertificate() {
    if (!pemPath_.empty()) {
      ::unlink(pemPath_.c_str());
    }
    ::X509_free(cert_);
    ::EVP_PKEY_free(key_);
    ::ERR_clear_error();
  }

  TestCertificate(const TestCertificate&) = delete;
  TestCertificate& operator=(const TestCertificate&) = delete;

  [[nodiscard]] bool ready() const noexcept { return ready_; }

  /// PEM file holding the certificate.
  [[nodiscard]] const std::string& pemPath() const noexcept { return pemPath_; }

  /// @brief Server context presenting this certificate. Caller frees it.
  [[nodiscard]] SSL_CTX* makeServerContext() const {
    SSL_CTX* ctx = ::SSL_CTX_new(::TLS_server_method());
    if (ctx == nullptr) {
      return nullptr;
    }
    if (::SSL_CTX_use_certificate(ctx, cert_) != 1 || ::SSL_CTX_use_PrivateKey(ctx, key_) != 1) {
      ::SSL_CTX_free(ctx);
      ::ERR_clear_error();
      return nullptr;
    }
    return ctx;
  }

private:
  bool addExtension(int nid, const std::string& value) {
    X509V3_CTX v3{};
    X509V3_set_ctx_nodb(&v3);
    ::X509V3_set_ctx(&v3, cert_, cert_, nullptr, nullptr, 0);
    X509_EXTENSION* ext = ::X509V3_EXT_conf_nid(nullptr, &v3, nid, value.c_str());
    if (ext == nullptr) {
      return false;
    }
    const bool ADDED = ::X509_add_ext(cert_, ext, -1) == 1;
    ::X509_EXTENSION_free(ext);
    return ADDED;
  }

  EVP_PKEY* key_{nullptr};
  X509* cert_{nullptr};
  std::string pemPath_;
  bool ready_{false};
};

/// Port that is currently closed on 127.0.0.1 (bound then released).
inline std::uint16_t closedPort() {
  const int FD = ::socket(AF_INET, SOCK_STREAM, 0);
  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t len = sizeof(addr);
  std::uint16_t port = 0;
  if (FD >= 0 && ::bind(FD, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0 &&
      ::getsockname(FD, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
    port = ntohs(addr.sin_port);
  }
  if (FD >= 0) {
    ::close(FD);
  }
  return port;
}

} // namespace test
} // namespace nrpe
} // namespace watchpost

#endif // WATCHPOST_NRPE_UTST_LOOPBACK_SERVER_HPP
