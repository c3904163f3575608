#include "scheduler/timer_queue.hpp"

namespace turnstile {

TimerQueue::TimerId TimerQueue::add(TimePoint due, Callback callback) {
    const TimerId id = next_id_++;
    timers_.emplace(Key{due, id}, std::move(callback));
    by_id_.emplace(id, due);
    return id;
}

bool TimerQueue::remove(TimerId id) {
    const auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;

    timers_.erase(Key{it->second, id});
    by_id_.erase(it);
    return true;
}

std::optional<TimerQueue::TimePoint> TimerQueue::next_due() const {
    if (timers_.empty()) return std::nullopt;
    return timers_.begin()->first.first;
}

std::optional<TimerQueue::Entry> TimerQueue::pop_due(TimePoint now) {
    if (timers_.empty()) return std::nullopt;

    auto it = timers_.begin();
    if (it->first.first > now) return std::nullopt;

    Entry entry{it->first.second, it->first.first, std::move(it->second)};
    by_id_.erase(entry.id);
    timers_.erase(it);
    return entry;
}

void TimerQueue::clear() {
    timers_.clear();
    by_id_.clear();
}

} // namespace turnstile
