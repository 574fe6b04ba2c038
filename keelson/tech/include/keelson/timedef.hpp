#pragma once

#include <chrono>

namespace keelson {

/// The wall clock is system_clock, the only one convertible to Unix epoch time (needed for the Date header).
/// Timeouts and deadlines are measured with the monotonic steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace keelson
