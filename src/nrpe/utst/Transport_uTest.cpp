/**
 * @file Transport_uTest.cpp
 * @brief Unit tests for watchpost::nrpe transport layer.
 *
 * Notes:
 *  - Each test runs its own single-connection daemon on 127.0.0.1.
 *  - The ADH test is skipped when the local OpenSSL build lacks anonymous suites.
 *  - The timeout test takes about two seconds by construction.
 *  - Verified-TLS tests generate a throwaway self-signed certificate.
 */

#include "src/nrpe/inc/Packet.hpp"
#include "src/nrpe/inc/Transport.hpp"
#include "src/nrpe/utst/LoopbackServer.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <sys/socket.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using watchpost::nrpe::buildQuery;
using watchpost::nrpe::buildResponse;
using watchpost::nrpe::connectAndExchange;
using watchpost::nrpe::DEFAULT_PORT;
using watchpost::nrpe::NrpeResult;
using watchpost::nrpe::NrpeStatus;
using watchpost::nrpe::PACKET_SIZE;
using watchpost::nrpe::PacketBytes;
using watchpost::nrpe::parseResponse;
using watchpost::nrpe::ProtocolError;
using watchpost::nrpe::SocketHandle;
using watchpost::nrpe::TlsMode;
using watchpost::nrpe::TransportConfig;
using watchpost::nrpe::test::closedPort;
using watchpost::nrpe::test::LoopbackServer;
using watchpost::nrpe::test::makeAnonymousDhServerContext;
using watchpost::nrpe::test::readQuery;
using watchpost::nrpe::test::replyWith;
using watchpost::nrpe::test::TestCertificate;
using watchpost::nrpe::test::tlsReplyWith;
using watchpost::nrpe::test::tlsTrickleBytes;
using watchpost::nrpe::test::trickleBytes;
using watchpost::nrpe::test::waitForPeerClose;

namespace {

std::vector<std::uint8_t> responseBytes(std::int16_t code, const char* message) {
  PacketBytes r{};
  EXPECT_TRUE(buildResponse(code, message, r).ok());
  return std::vector<std::uint8_t>(r.begin(), r.end());
}

PacketBytes queryBytes(const char* command) {
  PacketBytes q{};
  EXPECT_TRUE(buildQuery(command, q).ok());
  return q;
}

TransportConfig plainConfig(std::uint16_t port) {
  TransportConfig cfg{};
  cfg.host = "127.0.0.1";
  cfg.port = port;
  cfg.tls.mode = TlsMode::NONE;
  cfg.timeout = std::chrono::milliseconds(3000);
  return cfg;
}

TransportConfig verifiedConfig(std::uint16_t port, const std::string& host,
                               const std::string& caFile) {
  TransportConfig cfg = plainConfig(port);
  cfg.host = host;
  cfg.tls.mode = TlsMode::VERIFIED;
  cfg.tls.caFile = caFile;
  return cfg;
}

std::chrono::milliseconds msSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

inline bool fdIsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1 || errno != EBADF; }

} // namespace

/* ----------------------------- SocketHandle Tests ----------------------------- */

/** @test Default handle owns nothing. */
TEST(SocketHandleTest, DefaultEmpty) {
  const SocketHandle H;
  EXPECT_FALSE(H.isOpen());
  EXPECT_EQ(H.get(), -1);
}

/** @test Destruction closes the descriptor. */
TEST(SocketHandleTest, ClosesOnDestruction) {
  int fd = -1;
  {
    SocketHandle h(::socket(AF_INET, SOCK_STREAM, 0));
    ASSERT_TRUE(h.isOpen());
    fd = h.get();
    EXPECT_TRUE(fdIsOpen(fd));
  }
  EXPECT_FALSE(fdIsOpen(fd));
}

/** @test Move transfers ownership exactly once. */
TEST(SocketHandleTest, MoveTransfersOwnership) {
  SocketHandle a(::socket(AF_INET, SOCK_STREAM, 0));
  ASSERT_TRUE(a.isOpen());
  const int FD = a.get();

  SocketHandle b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  EXPECT_EQ(b.get(), FD);

  SocketHandle c;
  c = std::move(b);
  EXPECT_EQ(c.get(), FD);
  EXPECT_TRUE(fdIsOpen(FD));

  c.reset();
  EXPECT_FALSE(fdIsOpen(FD));
}

/* ----------------------------- TransportConfig Tests ----------------------------- */

/** @test Defaults: NRPE port, legacy TLS, no timeout. */
TEST(TransportConfigTest, Defaults) {
  const TransportConfig CFG{};
  EXPECT_EQ(CFG.port, 5666);
  EXPECT_EQ(CFG.port, DEFAULT_PORT);
  EXPECT_EQ(CFG.tls.mode, TlsMode::ANONYMOUS_DH);
  EXPECT_EQ(CFG.timeout.count(), 0);
}

/* ----------------------------- Plain TCP Tests ----------------------------- */

/** @test One packet out, one packet back, query bytes delivered unchanged. */
TEST(PlainTransportTest, ExchangesOnePacket) {
  const PacketBytes QUERY = queryBytes("check_users");
  PacketBytes captured{};
  std::vector<std::uint8_t> response;

  {
    const LoopbackServer SERVER(replyWith(responseBytes(0, "OK - fine"), &captured));
    ASSERT_TRUE(SERVER.ready());

    const ProtocolError ERR = connectAndExchange(plainConfig(SERVER.port()), QUERY, response);
    ASSERT_TRUE(ERR.ok()) << ERR.toString();
  }

  EXPECT_EQ(response.size(), PACKET_SIZE);
  EXPECT_EQ(captured, QUERY);

  const NrpeResult RES = parseResponse(response);
  ASSERT_TRUE(RES.ok());
  EXPECT_EQ(RES.message, "OK - fine");
}

/** @test Works without a timeout (fully blocking path). */
TEST(PlainTransportTest, NoTimeoutBlockingPath) {
  const LoopbackServer SERVER(replyWith(responseBytes(1, "WARNING - x")));
  ASSERT_TRUE(SERVER.ready());

  TransportConfig cfg = plainConfig(SERVER.port());
  cfg.timeout = std::chrono::milliseconds(0);

  std::vector<std::uint8_t> response;
  ASSERT_TRUE(connectAndExchange(cfg, queryBytes("check_x"), response).ok());
  EXPECT_EQ(parseResponse(response).resultCode, 1);
}

/** @test Refused connection is CONNECT_ERROR with ECONNREFUSED. */
TEST(PlainTransportTest, ConnectionRefused) {
  const std::uint16_t PORT = closedPort();
  ASSERT_NE(PORT, 0);

  for (const int TIMEOUT_MS : {0, 1000}) {
    TransportConfig cfg = plainConfig(PORT);
    cfg.timeout = std::chrono::milliseconds(TIMEOUT_MS);

    std::vector<std::uint8_t> response{1, 2, 3};
    const ProtocolError ERR = connectAndExchange(cfg, queryBytes("check_load"), response);

    EXPECT_EQ(ERR.status, NrpeStatus::CONNECT_ERROR) << ERR.toString();
    EXPECT_EQ(ERR.sysErrno, ECONNREFUSED);
    EXPECT_TRUE(response.empty());
  }
}

/** @test A short reply at end of stream is returned as-is for the codec to reject. */
TEST(PlainTransportTest, ShortReplyIsFramingError) {
  std::vector<std::uint8_t> partial = responseBytes(0, "OK");
  partial.resize(100);
  const LoopbackServer SERVER(replyWith(partial));
  ASSERT_TRUE(SERVER.ready());

  std::vector<std::uint8_t> response;
  const ProtocolError ERR =
      connectAndExchange(plainConfig(SERVER.port()), queryBytes("check_load"), response);

  ASSERT_TRUE(ERR.ok()) << ERR.toString();
  EXPECT_EQ(response.size(), 100U);
  EXPECT_EQ(parseResponse(response).error.status, NrpeStatus::MALFORMED_PACKET);
}

/** @test Daemon closing without replying yields an empty, malformed response. */
TEST(PlainTransportTest, ClosedWithoutReply) {
  const LoopbackServer SERVER(replyWith({}));
  ASSERT_TRUE(SERVER.ready());

  std::vector<std::uint8_t> response;
  ASSERT_TRUE(
      connectAndExchange(plainConfig(SERVER.port()), queryBytes("check_load"), response).ok());
  EXPECT_TRUE(response.empty());

  const NrpeResult RES = parseResponse(response);
  EXPECT_EQ(RES.error.status, NrpeStatus::MALFORMED_PACKET);
  EXPECT_EQ(RES.error.actual, 0);
}

/** @test Silent daemon: TIMEOUT_ERROR after ~timeout, and the daemon sees the close. */
TEST(PlainTransportTest, TimeoutClosesSocket) {
  std::atomic<bool> peerClosed{false};
  LoopbackServer server([&peerClosed](int fd) {
    PacketBytes query{};
    readQuery(fd, query);
    peerClosed.store(waitForPeerClose(fd));
  });
  ASSERT_TRUE(server.ready());

  TransportConfig cfg = plainConfig(server.port());
  cfg.timeout = std::chrono::milliseconds(2000);

  std::vector<std::uint8_t> response;
  const auto START = std::chrono::steady_clock::now();
  const ProtocolError ERR = connectAndExchange(cfg, queryBytes("check_load"), response);
  const auto ELAPSED = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - START);

  EXPECT_EQ(ERR.status, NrpeStatus::TIMEOUT_ERROR) << ERR.toString();
  EXPECT_GE(ELAPSED.count(), 1900);
  EXPECT_LT(ELAPSED.count(), 4000);

  // Server handler returns once it reads EOF from our side.
  for (int i = 0; i < 200 && !server.done(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(server.done());
  EXPECT_TRUE(peerClosed.load());
}

/** @test Independent exchanges run concurrently without interference. */
TEST(PlainTransportTest, ConcurrentExchanges) {
  constexpr int N = 4;
  std::atomic<int> okCount{0};
  std::vector<std::thread> workers;

  for (int i = 0; i < N; ++i) {
    workers.emplace_back([i, &okCount]() {
      const std::string MSG = "OK - worker " + std::to_string(i);
      const LoopbackServer SERVER(replyWith(responseBytes(0, MSG.c_str())));
      if (!SERVER.ready()) {
        return;
      }
      std::vector<std::uint8_t> response;
      if (connectAndExchange(plainConfig(SERVER.port()), queryBytes("check_load"), response)
              .ok() &&
          parseResponse(response).message == MSG) {
        okCount.fetch_add(1);
      }
    });
  }
  for (std::thread& t : workers) {
    t.join();
  }

  EXPECT_EQ(okCount.load(), N);
}

/** @test A daemon dribbling one byte per 300ms cannot stretch a 500ms receive step. */
TEST(PlainTransportTest, SlowReplyBoundedByTimeout) {
  const LoopbackServer SERVER(trickleBytes(20, std::chrono::milliseconds(300)));
  ASSERT_TRUE(SERVER.ready());

  TransportConfig cfg = plainConfig(SERVER.port());
  cfg.timeout = std::chrono::milliseconds(500);

  std::vector<std::uint8_t> response;
  const auto START = std::chrono::steady_clock::now();
  const ProtocolError ERR = connectAndExchange(cfg, queryBytes("check_load"), response);
  const std::chrono::milliseconds ELAPSED = msSince(START);

  EXPECT_EQ(ERR.status, NrpeStatus::TIMEOUT_ERROR) << ERR.toString();
  EXPECT_GE(ELAPSED.count(), 400);
  EXPECT_LT(ELAPSED.count(), 1500);
  EXPECT_TRUE(response.empty());
}

/* ----------------------------- TLS Tests ----------------------------- */

/** @test TLS against a plaintext daemon fails the handshake, not the codec. */
TEST(TlsTransportTest, PlainDaemonFailsHandshake) {
  const std::vector<std::uint8_t> GARBAGE = responseBytes(0, "OK - not TLS");
  const LoopbackServer SERVER([&GARBAGE](int fd) {
    std::uint8_t hello[512];
    ::recv(fd, hello, sizeof(hello), 0);
    ::send(fd, GARBAGE.data(), GARBAGE.size(), MSG_NOSIGNAL);
  });
  ASSERT_TRUE(SERVER.ready());

  TransportConfig cfg = plainConfig(SERVER.port());
  cfg.tls.mode = TlsMode::ANONYMOUS_DH;

  std::vector<std::uint8_t> response;
  const ProtocolError ERR = connectAndExchange(cfg, queryBytes("check_load"), response);

  if (ERR.status == NrpeStatus::TLS_ERROR && ERR.detail.find("cipher suites unavailable") != std::string::npos) {
    GTEST_SKIP() << "ADH unavailable: " << ERR.toString();
  }
  EXPECT_EQ(ERR.status, NrpeStatus::TLS_ERROR) << ERR.toString();
  EXPECT_TRUE(response.empty());
}

/** @test Anonymous-DH exchange with a legacy-style daemon. */
TEST(TlsTransportTest, AnonymousDhExchange) {
  SSL_CTX* ctx = makeAnonymousDhServerContext();
  if (ctx == nullptr) {
    GTEST_SKIP() << "local OpenSSL cannot serve ADH suites";
  }

  {
    const LoopbackServer SERVER(tlsReplyWith(ctx, responseBytes(0, "OK - over ADH")));
    ASSERT_TRUE(SERVER.ready());

    TransportConfig cfg = plainConfig(SERVER.port());
    cfg.tls.mode = TlsMode::ANONYMOUS_DH;

    std::vector<std::uint8_t> response;
    const ProtocolError ERR = connectAndExchange(cfg, queryBytes("check_load"), response);

    EXPECT_TRUE(ERR.ok()) << ERR.toString();
    EXPECT_EQ(parseResponse(response).message, "OK - over ADH");
  }

  SSL_CTX_free(ctx);
}

/** @test One-byte TLS records every 300ms cannot stretch a 500ms receive step. */
TEST(TlsTransportTest, SlowTlsReplyBoundedByTimeout) {
  SSL_CTX* ctx = makeAnonymousDhServerContext();
  if (ctx == nullptr) {
    GTEST_SKIP() << "local OpenSSL cannot serve ADH suites";
  }

  ProtocolError err{};
  std::chrono::milliseconds elapsed{0};
  {
    const LoopbackServer SERVER(tlsTrickleBytes(ctx, 20, std::chrono::milliseconds(300)));
    ASSERT_TRUE(SERVER.ready());

    TransportConfig cfg = plainConfig(SERVER.port());
    cfg.tls.mode = TlsMode::ANONYMOUS_DH;
    cfg.timeout = std::chrono::milliseconds(500);

    std::vector<std::uint8_t> response;
    const auto START = std::chrono::steady_clock::now();
    err = connectAndExchange(cfg, queryBytes("check_load"), response);
    elapsed = msSince(START);
  }
  SSL_CTX_free(ctx);

  EXPECT_EQ(err.status, NrpeStatus::TIMEOUT_ERROR) << err.toString();
  EXPECT_LT(elapsed.count(), 1500);
}

/* ----------------------------- Verified TLS Tests ----------------------------- */

/** @test Trusted CA and matching host name: handshake and exchange succeed. */
TEST(VerifiedTlsTest, TrustedCertificateMatchingName) {
  const TestCertificate CERT("localhost");
  ASSERT_TRUE(CERT.ready());
  SSL_CTX* ctx = CERT.makeServerContext();
  ASSERT_NE(ctx, nullptr);

  ProtocolError err{};
  std::vector<std::uint8_t> response;
  {
    const LoopbackServer SERVER(tlsReplyWith(ctx, responseBytes(0, "OK - verified")));
    ASSERT_TRUE(SERVER.ready());
    err = connectAndExchange(verifiedConfig(SERVER.port(), "localhost", CERT.pemPath()),
                             queryBytes("check_load"), response);
  }
  SSL_CTX_free(ctx);

  ASSERT_TRUE(err.ok()) << err.toString();
  const NrpeResult RES = parseResponse(response);
  ASSERT_TRUE(RES.ok()) << RES.error.toString();
  EXPECT_EQ(RES.message, "OK - verified");
}

/** @test Connecting by an address the certificate does not list is rejected. */
TEST(VerifiedTlsTest, AddressNotInCertificate) {
  const TestCertificate CERT("localhost");
  ASSERT_TRUE(CERT.ready());
  SSL_CTX* ctx = CERT.makeServerContext();
  ASSERT_NE(ctx, nullptr);

  ProtocolError err{};
  std::vector<std::uint8_t> response;
  {
    const LoopbackServer SERVER(tlsReplyWith(ctx, responseBytes(0, "OK - unreachable")));
    ASSERT_TRUE(SERVER.ready());
    err = connectAndExchange(verifiedConfig(SERVER.port(), "127.0.0.1", CERT.pemPath()),
                             queryBytes("check_load"), response);
  }
  SSL_CTX_free(ctx);

  EXPECT_EQ(err.status, NrpeStatus::TLS_ERROR) << err.toString();
  EXPECT_NE(err.detail.find("certificate verify failed"), std::string::npos) << err.detail;
  EXPECT_TRUE(response.empty());
}

/** @test A certificate issued for another name is rejected. */
TEST(VerifiedTlsTest, HostNameMismatch) {
  const TestCertificate CERT("nrpe.example");
  ASSERT_TRUE(CERT.ready());
  SSL_CTX* ctx = CERT.makeServerContext();
  ASSERT_NE(ctx, nullptr);

  ProtocolError err{};
  std::vector<std::uint8_t> response;
  {
    const LoopbackServer SERVER(tlsReplyWith(ctx, responseBytes(0, "OK - unreachable")));
    ASSERT_TRUE(SERVER.ready());
    err = connectAndExchange(verifiedConfig(SERVER.port(), "localhost", CERT.pemPath()),
                             queryBytes("check_load"), response);
  }
  SSL_CTX_free(ctx);

  EXPECT_EQ(err.status, NrpeStatus::TLS_ERROR) << err.toString();
  EXPECT_NE(err.detail.find("certificate verify failed"), std::string::npos) << err.detail;
}

/** @test A server certificate not issued by the configured CA is rejected. */
TEST(VerifiedTlsTest, UntrustedIssuer) {
  const TestCertificate SERVER_CERT("localhost");
  const TestCertificate OTHER_CA("other.example");
  ASSERT_TRUE(SERVER_CERT.ready());
  ASSERT_TRUE(OTHER_CA.ready());
  SSL_CTX* ctx = SERVER_CERT.makeServerContext();
  ASSERT_NE(ctx, nullptr);

  ProtocolError err{};
  std::vector<std::uint8_t> response;
  {
    const LoopbackServer SERVER(tlsReplyWith(ctx, responseBytes(0, "OK - unreachable")));
    ASSERT_TRUE(SERVER.ready());
    err = connectAndExchange(verifiedConfig(SERVER.port(), "localhost", OTHER_CA.pemPath()),
                             queryBytes("check_load"), response);
  }
  SSL_CTX_free(ctx);

  EXPECT_EQ(err.status, NrpeStatus::TLS_ERROR) << err.toString();
  EXPECT_NE(err.detail.find("certificate verify failed"), std::string::npos) << err.detail;
}
