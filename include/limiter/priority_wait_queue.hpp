#pragma once

#include "scheduler/ischeduler.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>

namespace turnstile {

/**
 * @brief Handle to a queued request's current lane position
 *
 * Shared between the lane slot and whoever may cancel the request (the
 * deadline timer). Compaction rewrites `position`, so a ticket always
 * points at its own request.
 */
struct QueueTicket {
    int priority = 0;
    uint64_t position = 0;
    bool queued = false;
    std::optional<IScheduler::TimerId> deadline_timer;
};

using Ticket = std::shared_ptr<QueueTicket>;

/**
 * @brief One waiting caller
 */
struct WaitingRequest {
    using AdmitCallback = std::function<void()>;
    using TimeoutCallback = std::function<void()>;

    int priority = 0;
    AdmitCallback on_admit;
    TimeoutCallback on_timeout;
    std::optional<IScheduler::TimePoint> deadline;  // nullopt = never times out
    Ticket ticket;
};

/**
 * @brief Priority-grouped FIFO of waiting requests
 *
 * One lane per priority value in use. A lane is a sparse index map with
 * monotonically increasing cursors: live entries occupy [head, tail).
 * Lanes are created on first enqueue and erased the moment they empty.
 *
 * - enqueue: O(log P), P = distinct priorities
 * - dequeue_highest: O(log P)
 * - cancel: O(k + log P), k = entries ahead of the cancelled one in its lane
 * - length / is_empty: O(1)
 *
 * Not thread-safe; AdmissionController serializes access.
 */
class PriorityWaitQueue {
public:
    struct Lane {
        uint64_t head = 0;
        uint64_t tail = 0;
        std::unordered_map<uint64_t, WaitingRequest> slots;

        [[nodiscard]] bool empty() const { return head == tail; }
        [[nodiscard]] size_t size() const { return static_cast<size_t>(tail - head); }
    };

    PriorityWaitQueue() = default;

    PriorityWaitQueue(const PriorityWaitQueue&) = delete;
    PriorityWaitQueue& operator=(const PriorityWaitQueue&) = delete;

    /**
     * @brief Append to the tail of the request's priority lane
     *
     * Allocates the request's ticket when it has none.
     * @return Ticket carrying priority and assigned position
     */
    Ticket enqueue(int priority, WaitingRequest request);

    /**
     * @brief Pop the head of the highest-priority non-empty lane
     */
    [[nodiscard]] std::optional<WaitingRequest> dequeue_highest();

    /**
     * @brief Remove the request at `position` in lane `priority`
     *
     * Idempotent: returns nullopt when nothing is queued there. Requests
     * ahead of the removed one shift one slot toward the hole and head
     * advances, so the live range stays contiguous and the order of the
     * survivors is unchanged.
     */
    std::optional<WaitingRequest> cancel(int priority, uint64_t position);

    /**
     * @brief Cancel via ticket; no-op once the request left the queue
     */
    std::optional<WaitingRequest> cancel(const QueueTicket& ticket);

    [[nodiscard]] bool is_empty() const { return size_ == 0; }
    [[nodiscard]] size_t length() const { return size_; }

    [[nodiscard]] std::optional<int> highest_priority() const { return highest_priority_; }
    [[nodiscard]] size_t lane_count() const { return lanes_.size(); }

    /**
     * @brief Waiting requests at one priority (0 if the lane does not exist)
     */
    [[nodiscard]] size_t lane_length(int priority) const;

private:
    void erase_lane(std::map<int, Lane>::iterator it);
    void recompute_highest_priority();

    std::map<int, Lane> lanes_;
    std::optional<int> highest_priority_;
    size_t size_ = 0;
};

} // namespace turnstile
