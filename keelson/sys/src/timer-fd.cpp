#include "keelson/timer-fd.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>

#include "keelson/errno-throw.hpp"
#include "keelson/log.hpp"
#include "keelson/timedef.hpp"

namespace keelson {

namespace {

timespec ToTimespec(SysDuration dur) {
  if (dur <= SysDuration::zero()) {
    return {0, 0};
  }
  const auto secs = std::chrono::floor<std::chrono::seconds>(dur);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(dur - secs);
  return {static_cast<time_t>(secs.count()), static_cast<long>(nanos.count())};
}

}  // namespace

TimerFd::TimerFd() : _baseFd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("timerfd creation failed");
  }
}

void TimerFd::schedule(SysDuration delay, SysDuration period) const {
  // A zero it_value stops the timer whatever the period.
  const itimerspec spec{ToTimespec(period), ToTimespec(delay)};
  if (::timerfd_settime(fd(), 0, &spec, nullptr) != 0) {
    throw_errno("timerfd_settime failed (fd # {})", fd());
  }
}

uint64_t TimerFd::drain() const noexcept {
  // A single read returns every expiration accumulated so far.
  uint64_t expirations = 0;
  if (::read(fd(), &expirations, sizeof(expirations)) == -1) {
    if (errno != EAGAIN) {
      const auto err = errno;
      log::error("Reading timerfd # {} failed err={}: {}", fd(), err, std::strerror(err));
    }
    return 0;
  }
  return expirations;
}

}  // namespace keelson
