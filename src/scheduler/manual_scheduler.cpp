#include "scheduler/manual_scheduler.hpp"
#include "core/utils.hpp"

#include <stdexcept>

namespace turnstile {

IScheduler::TimePoint ManualScheduler::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

IScheduler::TimerId ManualScheduler::schedule_after(Duration delay, Callback callback) {
    std::lock_guard lock(mutex_);
    const Duration clamped = delay < Duration::zero() ? Duration::zero() : delay;
    return timers_.add(now_ + clamped, std::move(callback));
}

bool ManualScheduler::cancel(TimerId id) {
    std::lock_guard lock(mutex_);
    return timers_.remove(id);
}

size_t ManualScheduler::pending() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
}

size_t ManualScheduler::advance(Duration delta) {
    if (delta < Duration::zero()) {
        throw std::invalid_argument("ManualScheduler cannot move time backwards");
    }
    TimePoint target;
    {
        std::lock_guard lock(mutex_);
        target = now_ + delta;
    }
    return fire_until(target);
}

size_t ManualScheduler::advance_seconds(double seconds) {
    if (!utils::is_valid_seconds(seconds)) {
        throw std::invalid_argument("ManualScheduler advance must be finite and non-negative");
    }
    return advance(utils::to_duration<Duration>(std::chrono::duration<double>(seconds)));
}

size_t ManualScheduler::run_due() {
    return fire_until(now());
}

IScheduler::Duration ManualScheduler::elapsed() const {
    std::lock_guard lock(mutex_);
    return now_.time_since_epoch();
}

size_t ManualScheduler::fire_until(TimePoint target) {
    size_t fired = 0;
    for (;;) {
        std::optional<TimerQueue::Entry> entry;
        {
            std::lock_guard lock(mutex_);
            const auto due = timers_.next_due();
            if (!due || *due > target) {
                now_ = target;
                return fired;
            }
            // Jump to the timer's due time before running it
            if (*due > now_) now_ = *due;
            entry = timers_.pop_due(now_);
        }

        if (entry && entry->callback) {
            entry->callback();
            ++fired;
        }
    }
}

} // namespace turnstile
