#ifndef WATCHPOST_NRPE_DEADLINE_HPP
#define WATCHPOST_NRPE_DEADLINE_HPP
/**
 * @file Deadline.hpp
 * @brief Absolute time bound for one blocking step, and a poll() wait on it.
 * @note Linux-only. Uses poll().
 *
 * A step (connect, handshake, send, receive) takes one Deadline when it
 * starts. Every wait inside that step uses the time remaining, so a peer
 * that trickles data cannot stretch the step past its timeout.
 */

#include <chrono> // std::chrono::steady_clock, std::chrono::milliseconds

namespace watchpost {

namespace nrpe {

/* ----------------------------- Deadline ----------------------------- */

class Deadline {
public:
  using Clock = std::chrono::steady_clock;

  /// @brief Deadline timeout from now; timeout <= 0 yields an unbounded deadline.
  [[nodiscard]] static Deadline after(std::chrono::milliseconds timeout) noexcept;

  [[nodiscard]] bool bounded() const noexcept { return bounded_; }

  /// @brief True once a bounded deadline has passed. Never true when unbounded.
  [[nodiscard]] bool expired() const noexcept;

  /// @brief Time left, rounded up to whole milliseconds; 0 once expired.
  [[nodiscard]] std::chrono::milliseconds remaining() const noexcept;

  /// @brief poll() timeout argument: -1 when unbounded, else remaining().
  [[nodiscard]] int pollTimeoutMs() const noexcept;

private:
  Clock::time_point at_{};
  bool bounded_{false};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Wait until fd reports one of events or the deadline passes.
 * @param fd Socket descriptor.
 * @param events poll() event mask (POLLIN, POLLOUT).
 * @param deadline Bound for the wait; EINTR resumes with the remaining time.
 * @return >0 ready (including error/hangup conditions), 0 on timeout,
 *         -1 on poll() failure with errno set.
 */
[[nodiscard]] int waitFor(int fd, short events, const Deadline& deadline) noexcept;

} // namespace nrpe

} // namespace watchpost

#endif // WATCHPOST_NRPE_DEADLINE_HPP
