#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace turnstile {

/**
 * @brief Abstract one-shot timer scheduler
 *
 * The deferred-callback primitive behind every limiter timer. Enables a
 * real-time backend (ThreadScheduler) and a virtual-time backend
 * (ManualScheduler) for single-threaded embedders and deterministic tests.
 *
 * Contract:
 * - A timer fires no earlier than now() + delay.
 * - Timers with the same due time fire in scheduling order.
 * - Callbacks never run while the scheduler holds its own lock, so a
 *   callback may schedule or cancel timers.
 * - cancel() cannot stop a callback that has already been taken for
 *   execution; callers must tolerate a late callback.
 */
class IScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    virtual ~IScheduler() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    /**
     * @brief Arm a one-shot timer
     * @param delay Delay from now(); negative delays fire as soon as possible
     * @param callback Invoked once when the timer fires
     * @return Id usable with cancel()
     * @throws std::logic_error if the backend no longer runs timers
     */
    virtual TimerId schedule_after(Duration delay, Callback callback) = 0;

    /**
     * @brief Disarm a timer that has not fired yet
     * @return true if the timer was pending and is now removed
     */
    virtual bool cancel(TimerId id) = 0;

    /**
     * @brief Number of armed, not yet fired timers
     */
    [[nodiscard]] virtual size_t pending() const = 0;
};

} // namespace turnstile
