#include "limiter/window_tracker.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace turnstile {

WindowTracker::WindowTracker(uint32_t capacity, IScheduler::Duration window,
                             IScheduler& scheduler, PriorityWaitQueue& queue)
    : capacity_(capacity), window_(window), scheduler_(scheduler), queue_(queue) {}

void WindowTracker::set_release_handler(ReleaseHandler handler) {
    release_handler_ = std::move(handler);
}

bool WindowTracker::try_grant(WaitingRequest& request, Completions& completions) {
    if (in_flight_ >= capacity_) return false;
    grant(std::move(request), completions);
    return true;
}

void WindowTracker::grant(WaitingRequest request, Completions& completions) {
    // Arm the release before taking the slot so a refused timer changes nothing
    schedule_release();
    ++in_flight_;

    if (request.ticket && request.ticket->deadline_timer) {
        scheduler_.cancel(*request.ticket->deadline_timer);
        request.ticket->deadline_timer.reset();
    }

    if (request.on_admit) {
        completions.push_back(std::move(request.on_admit));
    }
}

void WindowTracker::schedule_release() {
    const ReleaseId id = next_release_id_++;
    const auto fires_at = scheduler_.now() + window_;
    const auto timer_id = scheduler_.schedule_after(window_, [handler = release_handler_, id] {
        if (handler) handler(id);
    });
    pending_releases_.emplace(id, PendingRelease{timer_id, fires_at});
}

bool WindowTracker::on_release(ReleaseId id, Completions& completions) {
    const auto it = pending_releases_.find(id);
    if (it == pending_releases_.end()) return false;

    pending_releases_.erase(it);
    --in_flight_;

    auto next = queue_.dequeue_highest();
    if (!next) return false;

    const int priority = next->priority;
    grant(std::move(*next), completions);
    ++granted_from_queue_;
    utils::log::debug(std::format("Released slot refilled from priority {} lane ({} still waiting)",
                                  priority, queue_.length()));
    return true;
}

std::chrono::duration<double> WindowTracker::time_until_next_release() const {
    if (pending_releases_.empty()) return std::chrono::duration<double>::zero();

    const auto earliest = std::min_element(
        pending_releases_.begin(), pending_releases_.end(),
        [](const auto& a, const auto& b) { return a.second.fires_at < b.second.fires_at; });

    const auto remaining = earliest->second.fires_at - scheduler_.now();
    if (remaining <= IScheduler::Duration::zero()) {
        return std::chrono::duration<double>::zero();
    }
    return std::chrono::duration<double>(remaining);
}

void WindowTracker::cancel_pending() {
    for (const auto& [id, release] : pending_releases_) {
        scheduler_.cancel(release.timer_id);
    }
    pending_releases_.clear();
}

} // namespace turnstile
