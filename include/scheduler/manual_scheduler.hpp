#pragma once

#include "scheduler/ischeduler.hpp"
#include "scheduler/timer_queue.hpp"

#include <mutex>

namespace turnstile {

/**
 * @brief Virtual-time scheduler driven explicitly by its owner
 *
 * Time starts at the clock epoch and only moves on advance(). Intended for
 * single-threaded embedders that pump the limiter from their own loop, and
 * for deterministic tests of window and timeout behaviour.
 *
 * While a callback runs, now() equals that timer's due time, so work a
 * callback schedules is measured from the moment it logically fired.
 */
class ManualScheduler : public IScheduler {
public:
    ManualScheduler() = default;

    ManualScheduler(const ManualScheduler&) = delete;
    ManualScheduler& operator=(const ManualScheduler&) = delete;

    [[nodiscard]] TimePoint now() const override;
    TimerId schedule_after(Duration delay, Callback callback) override;
    bool cancel(TimerId id) override;
    [[nodiscard]] size_t pending() const override;

    /**
     * @brief Move time forward, firing every timer due within the interval
     * @return Number of callbacks invoked
     */
    size_t advance(Duration delta);

    /**
     * @brief Convenience overload taking fractional seconds
     */
    size_t advance_seconds(double seconds);

    /**
     * @brief Fire timers already due at the current time
     */
    size_t run_due();

    /**
     * @brief Elapsed virtual time since construction
     */
    [[nodiscard]] Duration elapsed() const;

private:
    size_t fire_until(TimePoint target);

    mutable std::mutex mutex_;
    TimePoint now_{};
    TimerQueue timers_;
};

} // namespace turnstile
