// components/memory_cache/src/clock.cpp
#include "memory_cache/clock.hpp"

namespace memory_cache {

TimePoint SystemClock::now() const {
    return Clock::now();
}

ManualClock::ManualClock(TimePoint start)
    : current_(start) {}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ += delta;
}

void ManualClock::set(TimePoint time) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = time;
}

std::shared_ptr<const IClock> defaultClock() {
    static const std::shared_ptr<const IClock> clock = std::make_shared<SystemClock>();
    return clock;
}

std::int64_t toEpochMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count();
}

TimePoint fromEpochMillis(std::int64_t millis) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds{millis}));
}

} // namespace memory_cache
