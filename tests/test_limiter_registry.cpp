#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "limiter/limiter_registry.hpp"
#include "scheduler/manual_scheduler.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace turnstile;
using namespace std::chrono_literals;

TEST_CASE("LimiterRegistry: built from config", "[registry]") {
    const std::string toml = R"(
[[limiters]]
name = "api"
capacity = 1
window_seconds = 10

[[limiters]]
name = "search"
capacity = 4
)";
    auto loaded = ConfigLoader::load_from_string(toml);
    REQUIRE(loaded.success);

    auto clock = std::make_shared<ManualScheduler>();
    auto registry = LimiterRegistry::from_config(loaded.config, clock);
    CHECK(registry->size() == 2);
    CHECK(registry->names() == std::vector<std::string>{"api", "search"});

    auto api = registry->get_limiter("api");
    REQUIRE(api);
    CHECK(api->capacity() == 1);
    CHECK(api->window().count() == 10.0);

    auto search = registry->get_limiter("search");
    REQUIRE(search);
    CHECK(search->window().count() == 60.0);

    CHECK(registry->get_limiter("missing") == nullptr);
}

TEST_CASE("LimiterRegistry: limiters share the scheduler but not capacity", "[registry]") {
    auto clock = std::make_shared<ManualScheduler>();
    LimiterRegistry registry(clock);

    AdmissionController::Config cfg;
    cfg.capacity = 1;
    cfg.window = AdmissionController::Seconds(10.0);
    auto a = registry.add_limiter("a", cfg);
    auto b = registry.add_limiter("b", cfg);

    auto fa = a->await_turn();
    auto fb = b->await_turn();
    CHECK(fa.wait_for(0s) == std::future_status::ready);
    CHECK(fb.wait_for(0s) == std::future_status::ready);
    CHECK(clock->pending() == 2);

    auto queued = a->await_turn();
    CHECK(a->length() == 1);
    CHECK(b->is_empty());

    clock->advance(10s);
    CHECK(queued.wait_for(0s) == std::future_status::ready);
}

TEST_CASE("LimiterRegistry: duplicate and empty names rejected", "[registry]") {
    LimiterRegistry registry(std::make_shared<ManualScheduler>());
    AdmissionController::Config cfg;
    cfg.capacity = 2;

    registry.add_limiter("api", cfg);
    CHECK_THROWS_AS(registry.add_limiter("api", cfg), std::invalid_argument);
    CHECK_THROWS_AS(registry.add_limiter("", cfg), std::invalid_argument);
    CHECK(registry.size() == 1);
}

TEST_CASE("LimiterRegistry: invalid limiter config rejected", "[registry]") {
    LimiterRegistry registry(std::make_shared<ManualScheduler>());
    AdmissionController::Config cfg;
    cfg.capacity = 0;

    CHECK_THROWS_AS(registry.add_limiter("api", cfg), std::invalid_argument);
    CHECK(registry.size() == 0);

    TurnstileConfig config;
    config.limiters.push_back(LimiterConfig{"neg", -1, 1.0});
    CHECK_THROWS_AS(LimiterRegistry::from_config(config, std::make_shared<ManualScheduler>()),
                    std::invalid_argument);
}

TEST_CASE("LimiterRegistry: requires a scheduler", "[registry]") {
    CHECK_THROWS_AS(LimiterRegistry(nullptr), std::invalid_argument);
}

TEST_CASE("LimiterRegistry: stats per limiter", "[registry]") {
    LimiterRegistry registry(std::make_shared<ManualScheduler>());
    AdmissionController::Config cfg;
    cfg.capacity = 1;
    auto api = registry.add_limiter("api", cfg);
    registry.add_limiter("idle", cfg);

    auto first = api->await_turn();
    auto second = api->await_turn();

    const auto stats = registry.get_all_stats();
    REQUIRE(stats.size() == 2);
    for (const auto& [name, s] : stats) {
        if (name == "api") {
            CHECK(s.in_flight == 1);
            CHECK(s.queue_depth == 1);
        } else {
            CHECK(s.in_flight == 0);
            CHECK(s.queue_depth == 0);
        }
    }
}
