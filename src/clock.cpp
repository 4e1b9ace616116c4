#include "sortid/clock.h"
#include <chrono>

namespace sortid {

Instant SystemClock::Now() {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

std::unique_ptr<IClock> CreateClock() {
    return std::make_unique<SystemClock>();
}

} // namespace sortid
