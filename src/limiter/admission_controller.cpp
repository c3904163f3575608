#include "limiter/admission_controller.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace turnstile {

struct AdmissionController::State {
    State(const Config& config, IScheduler& scheduler)
        : tracker(config.capacity,
                  utils::to_duration<IScheduler::Duration>(config.window),
                  scheduler, queue) {}

    mutable std::mutex mutex;
    PriorityWaitQueue queue;
    WindowTracker tracker;
    bool closed = false;

    uint64_t admitted_immediately = 0;
    uint64_t total_queued = 0;
    uint64_t timed_out = 0;
};

AdmissionController::AdmissionController(const Config& config, std::shared_ptr<IScheduler> scheduler)
    : config_(config), scheduler_(std::move(scheduler)) {
    if (config_.capacity == 0) {
        throw std::invalid_argument("AdmissionController capacity must be > 0");
    }
    const double window = config_.window.count();
    if (!std::isfinite(window) || window <= 0.0) {
        throw std::invalid_argument(
            std::format("AdmissionController window must be a positive number of seconds, got {}", window));
    }
    if (!scheduler_) {
        throw std::invalid_argument("AdmissionController requires a scheduler");
    }

    state_ = std::make_shared<State>(config_, *scheduler_);
    state_->tracker.set_release_handler(
        [weak = std::weak_ptr<State>(state_)](WindowTracker::ReleaseId id) {
            on_release(weak, id);
        });
}

AdmissionController::~AdmissionController() {
    std::lock_guard lock(state_->mutex);
    state_->closed = true;
    state_->tracker.cancel_pending();

    // Dropped requests never resolve; their promises report broken_promise
    size_t dropped = 0;
    while (auto request = state_->queue.dequeue_highest()) {
        if (request->ticket && request->ticket->deadline_timer) {
            scheduler_->cancel(*request->ticket->deadline_timer);
        }
        ++dropped;
    }
    if (dropped > 0) {
        utils::log::warn(std::format("Limiter destroyed with {} request(s) still waiting", dropped));
    }
}

std::future<void> AdmissionController::await_turn(int priority, Seconds timeout) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    await_turn(priority, timeout,
        [promise] { promise->set_value(); },
        [promise] { promise->set_exception(std::make_exception_ptr(WaitTimeout{})); });

    return future;
}

void AdmissionController::await_turn(int priority, Seconds timeout,
                                     AdmitCallback on_admit, TimeoutCallback on_timeout) {
    if (!utils::is_valid_seconds(timeout.count())) {
        throw std::invalid_argument(
            std::format("await_turn timeout must be a non-negative number of seconds, got {}",
                        timeout.count()));
    }

    WaitingRequest request;
    request.priority = priority;
    request.on_admit = std::move(on_admit);
    request.on_timeout = std::move(on_timeout);

    Completions completions;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->tracker.try_grant(request, completions)) {
            ++state_->admitted_immediately;
        } else {
            auto ticket = std::make_shared<QueueTicket>();
            request.ticket = ticket;

            if (timeout > Seconds::zero()) {
                const auto delay = utils::to_duration<IScheduler::Duration>(timeout);
                request.deadline = scheduler_->now() + delay;
                ticket->deadline_timer = scheduler_->schedule_after(delay,
                    [weak = std::weak_ptr<State>(state_), ticket] {
                        on_deadline(weak, ticket);
                    });
            }

            state_->queue.enqueue(priority, std::move(request));
            ++state_->total_queued;
            utils::log::debug(std::format("Queued request at priority {} (position {}, {} waiting)",
                                          priority, ticket->position, state_->queue.length()));
        }
    }
    run_completions(completions);
}

size_t AdmissionController::length() const {
    std::lock_guard lock(state_->mutex);
    return state_->queue.length();
}

bool AdmissionController::is_empty() const {
    std::lock_guard lock(state_->mutex);
    return state_->queue.is_empty();
}

uint32_t AdmissionController::used_slots() const {
    std::lock_guard lock(state_->mutex);
    return state_->tracker.in_flight();
}

AdmissionController::Seconds AdmissionController::time_until_next_admission() const {
    std::lock_guard lock(state_->mutex);
    if (state_->tracker.in_flight() < state_->tracker.capacity()) {
        return Seconds::zero();
    }
    return state_->tracker.time_until_next_release();
}

AdmissionController::Stats AdmissionController::get_stats() const {
    std::lock_guard lock(state_->mutex);
    return {
        .admitted_immediately = state_->admitted_immediately,
        .admitted_from_queue = state_->tracker.granted_from_queue(),
        .total_queued = state_->total_queued,
        .timed_out = state_->timed_out,
        .queue_depth = state_->queue.length(),
        .in_flight = state_->tracker.in_flight(),
        .capacity = state_->tracker.capacity(),
    };
}

void AdmissionController::run_completions(Completions& completions) {
    for (auto& completion : completions) {
        try {
            completion();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Limiter continuation threw: {}", e.what()));
        } catch (...) {
            utils::log::error("Limiter continuation threw: unknown error");
        }
    }
}

void AdmissionController::on_release(const std::weak_ptr<State>& weak, WindowTracker::ReleaseId id) {
    const auto state = weak.lock();
    if (!state) return;

    Completions completions;
    {
        std::lock_guard lock(state->mutex);
        if (state->closed) return;
        state->tracker.on_release(id, completions);
    }
    run_completions(completions);
}

void AdmissionController::on_deadline(const std::weak_ptr<State>& weak, const Ticket& ticket) {
    const auto state = weak.lock();
    if (!state) return;

    Completions completions;
    {
        std::lock_guard lock(state->mutex);
        if (state->closed) return;

        ticket->deadline_timer.reset();
        auto removed = state->queue.cancel(*ticket);
        if (!removed) return;  // admitted first

        ++state->timed_out;
        if (removed->on_timeout) {
            completions.push_back(std::move(removed->on_timeout));
        }
        utils::log::debug(std::format("Request at priority {} timed out ({} still waiting)",
                                      removed->priority, state->queue.length()));
    }
    run_completions(completions);
}

} // namespace turnstile
