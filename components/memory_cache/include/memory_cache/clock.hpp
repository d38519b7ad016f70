// components/memory_cache/include/memory_cache/clock.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace memory_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Source of wall-clock time for expiry and access bookkeeping
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Current wall-clock time
     */
    virtual TimePoint now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class SystemClock : public IClock {
public:
    TimePoint now() const override;
};

/**
 * @brief Clock that only moves when told to
 *
 * Used by tests and simulations that need to step across TTL boundaries
 * without sleeping.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(TimePoint start = Clock::now());

    TimePoint now() const override;

    /**
     * @brief Move the clock forward
     * @param delta Amount of time to add
     */
    void advance(std::chrono::milliseconds delta);

    /**
     * @brief Jump to an absolute time
     */
    void set(TimePoint time);

private:
    mutable std::mutex mutex_;
    TimePoint current_;
};

/**
 * @brief Shared system clock instance used when no clock is injected
 */
std::shared_ptr<const IClock> defaultClock();

/**
 * @brief Milliseconds since the Unix epoch
 */
std::int64_t toEpochMillis(TimePoint time);

/**
 * @brief Inverse of toEpochMillis
 */
TimePoint fromEpochMillis(std::int64_t millis);

} // namespace memory_cache
