#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace dynasty::e2ee {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn = std::function<TimePoint()>;

inline ClockFn SystemClock() {
    return [] { return Clock::now(); };
}

[[nodiscard]] inline int64_t ToUnixMillis(const TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline TimePoint FromUnixMillis(const int64_t millis) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

}
