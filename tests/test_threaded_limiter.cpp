#include <catch2/catch_test_macros.hpp>
#include "limiter/admission_controller.hpp"
#include "scheduler/thread_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace turnstile;
using namespace std::chrono_literals;

namespace {

AdmissionController::Config make_config(uint32_t capacity, double window_seconds) {
    AdmissionController::Config cfg;
    cfg.capacity = capacity;
    cfg.window = AdmissionController::Seconds(window_seconds);
    return cfg;
}

} // namespace

TEST_CASE("Threaded limiter: callers wait out the window", "[limiter][thread]") {
    auto scheduler = std::make_shared<ThreadScheduler>();
    AdmissionController limiter(make_config(1, 0.05), scheduler);

    const auto start = std::chrono::steady_clock::now();
    auto first = limiter.await_turn();
    auto second = limiter.await_turn();
    auto third = limiter.await_turn();

    CHECK(first.wait_for(0s) == std::future_status::ready);
    REQUIRE(third.wait_for(5s) == std::future_status::ready);
    second.get();
    third.get();

    CHECK(std::chrono::steady_clock::now() - start >= 100ms);
}

TEST_CASE("Threaded limiter: timeout fires before a long window", "[limiter][thread][timeout]") {
    auto scheduler = std::make_shared<ThreadScheduler>();
    AdmissionController limiter(make_config(1, 30), scheduler);

    auto holder = limiter.await_turn();
    const auto start = std::chrono::steady_clock::now();
    auto waiter = limiter.await_turn(5, AdmissionController::Seconds(0.05));

    REQUIRE(waiter.wait_for(5s) == std::future_status::ready);
    CHECK_THROWS_AS(waiter.get(), WaitTimeout);
    CHECK(std::chrono::steady_clock::now() - start >= 50ms);
    CHECK(limiter.is_empty());
    CHECK(limiter.used_slots() == 1);
}

TEST_CASE("Threaded limiter: concurrent callers never exceed capacity", "[limiter][thread]") {
    auto scheduler = std::make_shared<ThreadScheduler>();
    AdmissionController limiter(make_config(2, 0.02), scheduler);

    std::atomic<int> admitted{0};
    std::atomic<uint32_t> max_seen{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto turn = limiter.await_turn(i % 3);
            turn.get();
            admitted.fetch_add(1, std::memory_order_relaxed);

            const uint32_t used = limiter.used_slots();
            uint32_t prev = max_seen.load();
            while (used > prev && !max_seen.compare_exchange_weak(prev, used)) {}
        });
    }
    for (auto& t : threads) t.join();

    CHECK(admitted.load() == 8);
    CHECK(max_seen.load() <= 2);
    CHECK(limiter.is_empty());
}

TEST_CASE("Threaded limiter: stopped scheduler rejects callers instead of stranding them", "[limiter][thread]") {
    auto scheduler = std::make_shared<ThreadScheduler>();
    AdmissionController limiter(make_config(1, 0.05), scheduler);
    scheduler->stop();

    // Immediate admission needs a release timer
    CHECK_THROWS_AS(limiter.await_turn(), std::logic_error);
    CHECK(limiter.used_slots() == 0);
    CHECK(limiter.is_empty());
}
