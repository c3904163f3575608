#pragma once

#include "scheduler/ischeduler.hpp"
#include "scheduler/timer_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

namespace turnstile {

/**
 * @brief Real-time scheduler running timers on one background thread
 *
 * Uses std::chrono::steady_clock. Callbacks run on the timer thread with the
 * scheduler lock released, one at a time. An exception escaping a callback
 * is logged and the loop keeps running.
 *
 * stop() (also run by the destructor) joins the thread and discards timers
 * that have not fired; later schedule_after() calls throw std::logic_error.
 * Never destroy the scheduler from one of its own callbacks.
 */
class ThreadScheduler : public IScheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    [[nodiscard]] TimePoint now() const override;
    TimerId schedule_after(Duration delay, Callback callback) override;
    bool cancel(TimerId id) override;
    [[nodiscard]] size_t pending() const override;

    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

private:
    void run_loop(std::stop_token stop);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    TimerQueue timers_;
    std::atomic<bool> running_{false};
    std::jthread timer_thread_;
};

} // namespace turnstile
