#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "foresight/time_utils.hpp"

namespace foresight {

/**
 * @brief Source of "now" for every component
 *
 * Nothing in the pipeline reads the system clock directly, so temporal
 * rules can be replayed and tested against a controlled time line.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override
    {
        return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
    }
};

// Clock that only moves when told to; safe to read from worker threads
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start) : now_ns_(to_epoch_ns(start)) {}

    Timestamp now() const override { return from_epoch_ns(now_ns_.load(std::memory_order_acquire)); }

    void set(Timestamp t) { now_ns_.store(to_epoch_ns(t), std::memory_order_release); }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d)
    {
        now_ns_.fetch_add(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count(),
                          std::memory_order_acq_rel);
    }

private:
    std::atomic<int64_t> now_ns_;
};

}  // namespace foresight
