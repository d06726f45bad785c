#pragma once

#include <chrono>
#include <functional>

namespace utils {
    using SteadyClock = std::chrono::steady_clock;
    using TimePoint = SteadyClock::time_point;
    // Time source; tests substitute a manual clock.
    using NowFunction = std::function<TimePoint()>;

    inline TimePoint SteadyNow() {
        return SteadyClock::now();
    }
}
