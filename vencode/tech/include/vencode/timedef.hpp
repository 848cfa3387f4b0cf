#pragma once

#include <chrono>

namespace vencode {

/// system_clock is the only clock guaranteed to provide conversions to Unix epoch time, so encoded timestamps use it.
/// It is not monotonic - waits and deadlines use steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace vencode
