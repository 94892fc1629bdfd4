#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <chrono>

namespace flowdebug {

using u64 = std::uint64_t;
using i64 = std::int64_t;

using size_t = std::size_t;

// Zero-based position of a step inside a flow
using StepIndex = i64;

// Wildcard step index: matches every step
constexpr StepIndex kAnyStep = -1;

// Value of the current-step pointer before the first step starts
constexpr StepIndex kNoStep = -1;

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = SteadyClock::time_point;
using WallTime = SystemClock::time_point;
using Duration = std::chrono::nanoseconds;

// Seconds since the Unix epoch, with sub-second precision
inline double to_epoch_seconds(WallTime time) {
    return std::chrono::duration<double>(time.time_since_epoch()).count();
}

inline double to_seconds(Duration duration) {
    return std::chrono::duration<double>(duration).count();
}

}  // namespace flowdebug
