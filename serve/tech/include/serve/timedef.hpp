#pragma once

#include <chrono>

namespace serve {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
/// Durations measured inside the event loops use steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;

}  // namespace serve
