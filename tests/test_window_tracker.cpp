#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "limiter/window_tracker.hpp"
#include "scheduler/manual_scheduler.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace turnstile;
using namespace std::chrono_literals;

namespace {

struct TrackerFixture {
    explicit TrackerFixture(uint32_t capacity)
        : tracker(capacity, 10s, scheduler, queue) {
        tracker.set_release_handler([this](WindowTracker::ReleaseId id) {
            Completions completions;
            tracker.on_release(id, completions);
            for (auto& c : completions) c();
        });
    }

    WaitingRequest request(const std::string& label) {
        WaitingRequest r;
        r.on_admit = [this, label] { admitted.push_back(label); };
        return r;
    }

    bool grant_now(const std::string& label) {
        Completions completions;
        auto r = request(label);
        const bool granted = tracker.try_grant(r, completions);
        for (auto& c : completions) c();
        return granted;
    }

    ManualScheduler scheduler;
    PriorityWaitQueue queue;
    WindowTracker tracker;
    std::vector<std::string> admitted;
};

} // namespace

TEST_CASE("WindowTracker: grants while under capacity", "[tracker]") {
    TrackerFixture f(2);

    CHECK(f.grant_now("a"));
    CHECK(f.grant_now("b"));
    CHECK(f.admitted == std::vector<std::string>{"a", "b"});
    CHECK(f.tracker.in_flight() == 2);
    CHECK(f.tracker.pending_releases() == 2);
}

TEST_CASE("WindowTracker: refuses at capacity and leaves request intact", "[tracker]") {
    TrackerFixture f(1);
    REQUIRE(f.grant_now("a"));

    Completions completions;
    auto r = f.request("b");
    CHECK_FALSE(f.tracker.try_grant(r, completions));
    CHECK(completions.empty());
    CHECK(static_cast<bool>(r.on_admit));
    CHECK(f.tracker.in_flight() == 1);
}

TEST_CASE("WindowTracker: slot frees after the window when nobody waits", "[tracker]") {
    TrackerFixture f(1);
    REQUIRE(f.grant_now("a"));

    f.scheduler.advance(9s);
    CHECK(f.tracker.in_flight() == 1);

    f.scheduler.advance(1s);
    CHECK(f.tracker.in_flight() == 0);
    CHECK(f.tracker.pending_releases() == 0);
    CHECK(f.tracker.time_until_next_release().count() == 0.0);
}

TEST_CASE("WindowTracker: released slot goes to highest-priority waiter", "[tracker]") {
    TrackerFixture f(1);
    REQUIRE(f.grant_now("first"));

    f.queue.enqueue(1, f.request("low"));
    f.queue.enqueue(5, f.request("high"));

    f.scheduler.advance(10s);
    CHECK(f.admitted == std::vector<std::string>{"first", "high"});
    CHECK(f.tracker.in_flight() == 1);
    CHECK(f.tracker.granted_from_queue() == 1);
    CHECK(f.queue.length() == 1);

    // The refilled slot holds its own full window
    CHECK(f.tracker.time_until_next_release().count() == Catch::Approx(10.0));

    f.scheduler.advance(10s);
    CHECK(f.admitted == std::vector<std::string>{"first", "high", "low"});

    f.scheduler.advance(10s);
    CHECK(f.tracker.in_flight() == 0);
}

TEST_CASE("WindowTracker: time until next release tracks the earliest slot", "[tracker]") {
    TrackerFixture f(2);
    CHECK(f.tracker.time_until_next_release().count() == 0.0);

    REQUIRE(f.grant_now("a"));
    f.scheduler.advance(4s);
    REQUIRE(f.grant_now("b"));

    CHECK(f.tracker.time_until_next_release().count() == Catch::Approx(6.0));
    f.scheduler.advance(6s);
    CHECK(f.tracker.time_until_next_release().count() == Catch::Approx(4.0));
}

TEST_CASE("WindowTracker: grant cancels the request's deadline timer", "[tracker]") {
    TrackerFixture f(1);
    REQUIRE(f.grant_now("a"));

    bool deadline_fired = false;
    auto r = f.request("b");
    r.ticket = std::make_shared<QueueTicket>();
    r.ticket->deadline_timer = f.scheduler.schedule_after(30s, [&] { deadline_fired = true; });
    f.queue.enqueue(0, std::move(r));

    CHECK(f.scheduler.pending() == 2);
    f.scheduler.advance(10s);
    CHECK(f.admitted == std::vector<std::string>{"a", "b"});

    // Only b's release remains armed
    CHECK(f.scheduler.pending() == 1);
    f.scheduler.advance(30s);
    CHECK_FALSE(deadline_fired);
}

TEST_CASE("WindowTracker: unknown release id is ignored", "[tracker]") {
    TrackerFixture f(1);
    REQUIRE(f.grant_now("a"));

    Completions completions;
    CHECK_FALSE(f.tracker.on_release(999, completions));
    CHECK(f.tracker.in_flight() == 1);
}

TEST_CASE("WindowTracker: cancel_pending disarms release timers", "[tracker]") {
    TrackerFixture f(3);
    REQUIRE(f.grant_now("a"));
    REQUIRE(f.grant_now("b"));
    CHECK(f.scheduler.pending() == 2);

    f.tracker.cancel_pending();
    CHECK(f.scheduler.pending() == 0);
    CHECK(f.tracker.pending_releases() == 0);
}
