#pragma once

#include <cstdint>

#include "keelson/base-fd.hpp"
#include "keelson/timedef.hpp"

namespace keelson {

// Monotonic timerfd watched by the event loop. Drives the maintenance sweep, the notify callback and the graceful
// shutdown deadline.
class TimerFd {
 public:
  // Created stopped.
  TimerFd();

  // First expiration after delay, then every period (zero period: single shot). A non-positive delay stops the timer.
  void schedule(SysDuration delay, SysDuration period = SysDuration::zero()) const;

  void every(SysDuration period) const { schedule(period, period); }

  void stop() const { schedule(SysDuration::zero()); }

  // Number of expirations since the last call, 0 if none.
  uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace keelson
