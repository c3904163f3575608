#pragma once

#include "limiter/priority_wait_queue.hpp"
#include "scheduler/ischeduler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace turnstile {

/**
 * @brief Continuations collected under the controller lock and run after it
 *        is released
 */
using Completions = std::vector<std::function<void()>>;

/**
 * @brief Sliding-window capacity accounting
 *
 * Every grant occupies one slot for exactly `window`. When a slot's release
 * timer fires, the slot is handed straight to the highest-priority waiter,
 * so in_flight drops below capacity only while nobody waits.
 *
 * Not thread-safe. The release timer calls the release handler installed by
 * the owner, which must take the owner's lock and call on_release().
 */
class WindowTracker {
public:
    using ReleaseId = uint64_t;
    using ReleaseHandler = std::function<void(ReleaseId)>;

    WindowTracker(uint32_t capacity, IScheduler::Duration window,
                  IScheduler& scheduler, PriorityWaitQueue& queue);

    WindowTracker(const WindowTracker&) = delete;
    WindowTracker& operator=(const WindowTracker&) = delete;

    void set_release_handler(ReleaseHandler handler);

    /**
     * @brief Admit immediately if a slot is free
     * @return false when at capacity; the request is left untouched
     */
    [[nodiscard]] bool try_grant(WaitingRequest& request, Completions& completions);

    /**
     * @brief Occupy a slot for `request` and arm its release
     *
     * Cancels the request's deadline timer and queues its admit
     * continuation. Callers ensure a slot is free.
     */
    void grant(WaitingRequest request, Completions& completions);

    /**
     * @brief Release timer body: free the slot, then refill it from the queue
     * @return true if a waiting request was admitted into the freed slot
     */
    bool on_release(ReleaseId id, Completions& completions);

    /**
     * @brief Seconds until the earliest pending release, floored at zero
     */
    [[nodiscard]] std::chrono::duration<double> time_until_next_release() const;

    /**
     * @brief Disarm every pending release timer (owner teardown)
     */
    void cancel_pending();

    [[nodiscard]] uint32_t in_flight() const { return in_flight_; }
    [[nodiscard]] uint32_t capacity() const { return capacity_; }
    [[nodiscard]] IScheduler::Duration window() const { return window_; }
    [[nodiscard]] size_t pending_releases() const { return pending_releases_.size(); }
    [[nodiscard]] uint64_t granted_from_queue() const { return granted_from_queue_; }

private:
    struct PendingRelease {
        IScheduler::TimerId timer_id;
        IScheduler::TimePoint fires_at;
    };

    void schedule_release();

    uint32_t capacity_;
    IScheduler::Duration window_;
    IScheduler& scheduler_;
    PriorityWaitQueue& queue_;
    ReleaseHandler release_handler_;

    uint32_t in_flight_ = 0;
    ReleaseId next_release_id_ = 1;
    std::unordered_map<ReleaseId, PendingRelease> pending_releases_;
    uint64_t granted_from_queue_ = 0;
};

} // namespace turnstile
