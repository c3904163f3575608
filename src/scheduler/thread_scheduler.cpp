#include "scheduler/thread_scheduler.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <stdexcept>

namespace turnstile {

ThreadScheduler::ThreadScheduler() {
    running_.store(true);
    timer_thread_ = std::jthread([this](std::stop_token stop) {
        run_loop(std::move(stop));
    });
}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

IScheduler::TimePoint ThreadScheduler::now() const {
    return Clock::now();
}

IScheduler::TimerId ThreadScheduler::schedule_after(Duration delay, Callback callback) {
    TimerId id;
    {
        std::lock_guard lock(mutex_);
        if (!running_.load()) {
            throw std::logic_error("ThreadScheduler is stopped; timer would never fire");
        }
        const Duration clamped = delay < Duration::zero() ? Duration::zero() : delay;
        id = timers_.add(Clock::now() + clamped, std::move(callback));
    }
    cv_.notify_one();
    return id;
}

bool ThreadScheduler::cancel(TimerId id) {
    std::lock_guard lock(mutex_);
    return timers_.remove(id);
}

size_t ThreadScheduler::pending() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
}

void ThreadScheduler::stop() {
    if (!running_.exchange(false)) return;
    if (timer_thread_.joinable()) {
        timer_thread_.request_stop();
        timer_thread_.join();
    }

    std::lock_guard lock(mutex_);
    if (!timers_.empty()) {
        utils::log::debug(std::format("Scheduler stopped with {} unfired timer(s)", timers_.size()));
    }
    timers_.clear();
}

void ThreadScheduler::run_loop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        const auto due = timers_.next_due();
        if (!due) {
            // Idle: sleep until a timer is armed or stop is requested
            cv_.wait(lock, stop, [this] { return !timers_.empty(); });
            continue;
        }

        if (*due > Clock::now()) {
            // Wakes early when an earlier timer is armed
            cv_.wait_until(lock, stop, *due, [this, d = *due] {
                const auto next = timers_.next_due();
                return !next || *next < d;
            });
            continue;
        }

        auto entry = timers_.pop_due(Clock::now());
        if (!entry) continue;

        lock.unlock();
        try {
            if (entry->callback) entry->callback();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Scheduler timer {} callback failed: {}", entry->id, e.what()));
        } catch (...) {
            utils::log::error(std::format("Scheduler timer {} callback failed: unknown error", entry->id));
        }
        lock.lock();
    }
}

} // namespace turnstile
