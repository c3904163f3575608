#pragma once

#include "core/error.hpp"
#include "limiter/priority_wait_queue.hpp"
#include "limiter/window_tracker.hpp"
#include "scheduler/ischeduler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>

namespace turnstile {

/**
 * @brief Priority-ordered sliding-window admission limiter
 *
 * Admits at most `capacity` callers per rolling `window`:
 * - A slot is free: the caller is admitted at once, bypassing the queue.
 * - At capacity: the caller waits in its priority lane. When a slot's
 *   window elapses, the head of the highest-priority lane takes it.
 * - A positive timeout arms a deadline; if it fires first the caller is
 *   removed from its lane and fails with WaitTimeout.
 *
 * Exactly one of admission or timeout resolves each call.
 *
 * Thread-safety: all state is guarded by one mutex; scheduler callbacks
 * and callers serialize on it. Continuations run after the mutex is
 * released, on the calling thread (immediate admission) or in the
 * scheduler's callback context.
 */
class AdmissionController {
public:
    using Seconds = std::chrono::duration<double>;
    using AdmitCallback = WaitingRequest::AdmitCallback;
    using TimeoutCallback = WaitingRequest::TimeoutCallback;

    struct Config {
        uint32_t capacity = 1;
        Seconds window{60.0};
    };

    /**
     * @throws std::invalid_argument on zero capacity, or a window that is
     *         not a positive finite number of seconds
     */
    AdmissionController(const Config& config, std::shared_ptr<IScheduler> scheduler);
    ~AdmissionController();

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    /**
     * @brief Wait for a turn
     * @param priority Higher values are admitted first among waiters
     * @param timeout Maximum wait; zero waits forever
     * @return Future that becomes ready on admission, or holds WaitTimeout
     * @throws std::invalid_argument on a negative or non-finite timeout
     */
    [[nodiscard]] std::future<void> await_turn(int priority = 0, Seconds timeout = Seconds::zero());

    /**
     * @brief Continuation form of await_turn()
     *
     * Exactly one of `on_admit` / `on_timeout` is invoked (unless the
     * controller is destroyed first). `on_admit` may run before this call
     * returns.
     */
    void await_turn(int priority, Seconds timeout,
                    AdmitCallback on_admit, TimeoutCallback on_timeout);

    /**
     * @brief Requests currently waiting (not yet admitted)
     */
    [[nodiscard]] size_t length() const;
    [[nodiscard]] bool is_empty() const;

    /**
     * @brief Admissions whose window has not elapsed yet
     */
    [[nodiscard]] uint32_t used_slots() const;

    /**
     * @brief Time until the earliest occupied slot frees (zero if none)
     */
    [[nodiscard]] Seconds time_until_next_admission() const;

    [[nodiscard]] uint32_t capacity() const { return config_.capacity; }
    [[nodiscard]] Seconds window() const { return config_.window; }

    struct Stats {
        uint64_t admitted_immediately;
        uint64_t admitted_from_queue;
        uint64_t total_queued;
        uint64_t timed_out;
        size_t queue_depth;
        uint32_t in_flight;
        uint32_t capacity;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct State;

    static void run_completions(Completions& completions);
    static void on_release(const std::weak_ptr<State>& weak, WindowTracker::ReleaseId id);
    static void on_deadline(const std::weak_ptr<State>& weak, const Ticket& ticket);

    Config config_;
    std::shared_ptr<IScheduler> scheduler_;
    std::shared_ptr<State> state_;
};

} // namespace turnstile
