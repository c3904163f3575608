#include "limiter/priority_wait_queue.hpp"

namespace turnstile {

Ticket PriorityWaitQueue::enqueue(int priority, WaitingRequest request) {
    auto [it, inserted] = lanes_.try_emplace(priority);
    if (inserted && (!highest_priority_ || priority > *highest_priority_)) {
        highest_priority_ = priority;
    }

    Lane& lane = it->second;
    const uint64_t position = lane.tail;

    if (!request.ticket) {
        request.ticket = std::make_shared<QueueTicket>();
    }
    Ticket ticket = request.ticket;
    ticket->priority = priority;
    ticket->position = position;
    ticket->queued = true;

    request.priority = priority;
    lane.slots.emplace(position, std::move(request));
    ++lane.tail;
    ++size_;
    return ticket;
}

std::optional<WaitingRequest> PriorityWaitQueue::dequeue_highest() {
    if (!highest_priority_) return std::nullopt;

    const auto it = lanes_.find(*highest_priority_);
    if (it == lanes_.end()) {
        // Cache out of step with the lanes; rebuild rather than trust it
        recompute_highest_priority();
        return dequeue_highest();
    }

    Lane& lane = it->second;
    auto slot = lane.slots.find(lane.head);
    WaitingRequest request = std::move(slot->second);
    lane.slots.erase(slot);
    ++lane.head;
    --size_;

    if (request.ticket) request.ticket->queued = false;

    if (lane.empty()) {
        erase_lane(it);
    }
    return request;
}

std::optional<WaitingRequest> PriorityWaitQueue::cancel(int priority, uint64_t position) {
    const auto it = lanes_.find(priority);
    if (it == lanes_.end()) return std::nullopt;

    Lane& lane = it->second;
    if (position < lane.head || position >= lane.tail) return std::nullopt;

    const auto slot = lane.slots.find(position);
    if (slot == lane.slots.end()) return std::nullopt;

    WaitingRequest removed = std::move(slot->second);
    lane.slots.erase(slot);
    if (removed.ticket) removed.ticket->queued = false;

    // Shift [head, position) one slot toward the hole, back to front
    for (uint64_t i = position; i > lane.head; --i) {
        auto node = lane.slots.extract(i - 1);
        node.key() = i;
        if (node.mapped().ticket) node.mapped().ticket->position = i;
        lane.slots.insert(std::move(node));
    }
    ++lane.head;
    --size_;

    if (lane.empty()) {
        erase_lane(it);
    }
    return removed;
}

std::optional<WaitingRequest> PriorityWaitQueue::cancel(const QueueTicket& ticket) {
    if (!ticket.queued) return std::nullopt;
    return cancel(ticket.priority, ticket.position);
}

size_t PriorityWaitQueue::lane_length(int priority) const {
    const auto it = lanes_.find(priority);
    return it == lanes_.end() ? 0 : it->second.size();
}

void PriorityWaitQueue::erase_lane(std::map<int, Lane>::iterator it) {
    const int priority = it->first;
    lanes_.erase(it);
    if (highest_priority_ && *highest_priority_ == priority) {
        recompute_highest_priority();
    }
}

void PriorityWaitQueue::recompute_highest_priority() {
    if (lanes_.empty()) {
        highest_priority_.reset();
    } else {
        highest_priority_ = lanes_.rbegin()->first;
    }
}

} // namespace turnstile
