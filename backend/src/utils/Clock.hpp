#pragma once
#include <chrono>
#include <functional>

// Time source for everything that expires (freezes, reset challenges).
using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

inline Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

// Whole seconds left until `until`, rounded up so a caller never sees 0
// while the deadline is still in the future.
inline long long secondsUntil(TimePoint now, TimePoint until) {
    using namespace std::chrono;
    if (until <= now) return 0;
    auto ms = duration_cast<milliseconds>(until - now).count();
    return (ms + 999) / 1000;
}
