#pragma once

#include "scheduler/ischeduler.hpp"

#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace turnstile {

/**
 * @brief Ordered set of armed timers shared by the scheduler backends
 *
 * Timers are ordered by (due time, id); ids increase monotonically so equal
 * due times fire in scheduling order. Not thread-safe: each backend guards
 * it with its own mutex.
 */
class TimerQueue {
public:
    using TimePoint = IScheduler::TimePoint;
    using TimerId = IScheduler::TimerId;
    using Callback = IScheduler::Callback;

    struct Entry {
        TimerId id;
        TimePoint due;
        Callback callback;
    };

    TimerId add(TimePoint due, Callback callback);

    bool remove(TimerId id);

    /**
     * @brief Earliest due time, or nullopt when empty
     */
    [[nodiscard]] std::optional<TimePoint> next_due() const;

    /**
     * @brief Remove and return the earliest timer if it is due at or before `now`
     */
    [[nodiscard]] std::optional<Entry> pop_due(TimePoint now);

    void clear();

    [[nodiscard]] size_t size() const { return by_id_.size(); }
    [[nodiscard]] bool empty() const { return by_id_.empty(); }

private:
    using Key = std::pair<TimePoint, TimerId>;

    std::map<Key, Callback> timers_;
    std::unordered_map<TimerId, TimePoint> by_id_;
    TimerId next_id_ = 1;
};

} // namespace turnstile
