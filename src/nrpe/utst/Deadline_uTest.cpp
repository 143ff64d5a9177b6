/**
 * @file Deadline_uTest.cpp
 * @brief Unit tests for watchpost::nrpe::Deadline and waitFor().
 */

#include "src/nrpe/inc/Deadline.hpp"

#include <gtest/gtest.h>

#include <poll.h>
#include <pthread.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <thread>

using watchpost::nrpe::Deadline;
using watchpost::nrpe::waitFor;

namespace {

/// Connected AF_UNIX stream pair, closed on scope exit.
struct SocketPair {
  int fds[2]{-1, -1};
  SocketPair() { (void)::socketpair(AF_UNIX, SOCK_STREAM, 0, fds); }
  ~SocketPair() {
    for (const int FD : fds) {
      if (FD >= 0) {
        ::close(FD);
      }
    }
  }
  [[nodiscard]] bool ok() const noexcept { return fds[0] >= 0 && fds[1] >= 0; }
};

std::chrono::milliseconds msSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

void ignoreSignal(int) {}

} // namespace

/* ----------------------------- Deadline Tests ----------------------------- */

/** @test Zero timeout means no bound: never expires, poll waits forever. */
TEST(DeadlineTest, ZeroIsUnbounded) {
  const Deadline D = Deadline::after(std::chrono::milliseconds(0));
  EXPECT_FALSE(D.bounded());
  EXPECT_FALSE(D.expired());
  EXPECT_EQ(D.pollTimeoutMs(), -1);
}

/** @test A bounded deadline counts down and then reports expiry. */
TEST(DeadlineTest, BoundedCountsDown) {
  const Deadline D = Deadline::after(std::chrono::milliseconds(50));
  EXPECT_TRUE(D.bounded());
  EXPECT_FALSE(D.expired());
  EXPECT_GT(D.remaining().count(), 0);
  EXPECT_LE(D.remaining().count(), 50);

  std::this_thread::sleep_for(std::chrono::milliseconds(70));
  EXPECT_TRUE(D.expired());
  EXPECT_EQ(D.remaining().count(), 0);
  EXPECT_EQ(D.pollTimeoutMs(), 0);
}

/* ----------------------------- waitFor Tests ----------------------------- */

/** @test No data: waitFor returns 0 after roughly the remaining time. */
TEST(WaitForTest, TimesOutWithoutData) {
  const SocketPair PAIR;
  ASSERT_TRUE(PAIR.ok());

  const auto START = std::chrono::steady_clock::now();
  const int RC = waitFor(PAIR.fds[0], POLLIN, Deadline::after(std::chrono::milliseconds(100)));
  const auto ELAPSED = msSince(START);

  EXPECT_EQ(RC, 0);
  EXPECT_GE(ELAPSED.count(), 90);
  EXPECT_LT(ELAPSED.count(), 1000);
}

/** @test Pending data: ready immediately, bounded or not. */
TEST(WaitForTest, ReadyWhenDataPending) {
  const SocketPair PAIR;
  ASSERT_TRUE(PAIR.ok());
  const std::uint8_t BYTE = 7;
  ASSERT_EQ(::write(PAIR.fds[1], &BYTE, 1), 1);

  EXPECT_GT(waitFor(PAIR.fds[0], POLLIN, Deadline::after(std::chrono::milliseconds(1000))), 0);
  EXPECT_GT(waitFor(PAIR.fds[0], POLLIN, Deadline::after(std::chrono::milliseconds(0))), 0);
}

/** @test Signals during the wait do not restart the full timeout. */
TEST(WaitForTest, InterruptedWaitKeepsDeadline) {
  const SocketPair PAIR;
  ASSERT_TRUE(PAIR.ok());

  struct sigaction action{};
  struct sigaction previous{};
  action.sa_handler = ignoreSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0; // no SA_RESTART: poll() returns EINTR
  ASSERT_EQ(::sigaction(SIGUSR1, &action, &previous), 0);

  const pthread_t WAITER = ::pthread_self();
  std::thread interrupter([WAITER]() {
    for (int i = 0; i < 5; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(150));
      ::pthread_kill(WAITER, SIGUSR1);
    }
  });

  const auto START = std::chrono::steady_clock::now();
  const int RC = waitFor(PAIR.fds[0], POLLIN, Deadline::after(std::chrono::milliseconds(400)));
  const auto ELAPSED = msSince(START);

  interrupter.join();
  ::sigaction(SIGUSR1, &previous, nullptr);

  EXPECT_EQ(RC, 0);
  EXPECT_GE(ELAPSED.count(), 390);
  EXPECT_LT(ELAPSED.count(), 700);
}
