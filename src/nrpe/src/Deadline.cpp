/**
 * @file Deadline.cpp
 * @brief Step deadlines and deadline-bounded poll().
 */

#include "src/nrpe/inc/Deadline.hpp"

#include <poll.h> // poll

#include <cerrno>  // errno, EINTR
#include <climits> // INT_MAX

namespace watchpost {

namespace nrpe {

/* ----------------------------- Deadline Methods ----------------------------- */

Deadline Deadline::after(std::chrono::milliseconds timeout) noexcept {
  Deadline d{};
  if (timeout.count() > 0) {
    d.bounded_ = true;
    d.at_ = Clock::now() + timeout;
  }
  return d;
}

bool Deadline::expired() const noexcept { return bounded_ && Clock::now() >= at_; }

std::chrono::milliseconds Deadline::remaining() const noexcept {
  const auto LEFT = std::chrono::ceil<std::chrono::milliseconds>(at_ - Clock::now());
  return LEFT.count() > 0 ? LEFT : std::chrono::milliseconds{0};
}

int Deadline::pollTimeoutMs() const noexcept {
  if (!bounded_) {
    return -1;
  }
  const auto LEFT = remaining().count();
  return LEFT > INT_MAX ? INT_MAX : static_cast<int>(LEFT);
}

/* ----------------------------- API ----------------------------- */

int waitFor(int fd, short events, const Deadline& deadline) noexcept {
  struct pollfd pfd{};
  pfd.fd = fd;
  pfd.events = events;

  for (;;) {
    const int RC = ::poll(&pfd, 1, deadline.pollTimeoutMs());
    if (RC >= 0) {
      return RC;
    }
    if (errno != EINTR) {
      return -1;
    }
    if (deadline.expired()) {
      return 0;
    }
  }
}

} // namespace nrpe

} // namespace watchpost
