#include "limiter/limiter_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <stdexcept>

namespace turnstile {

LimiterRegistry::LimiterRegistry(std::shared_ptr<IScheduler> scheduler)
    : scheduler_(std::move(scheduler)) {
    if (!scheduler_) {
        throw std::invalid_argument("LimiterRegistry requires a scheduler");
    }
}

std::unique_ptr<LimiterRegistry> LimiterRegistry::from_config(
    const TurnstileConfig& config, std::shared_ptr<IScheduler> scheduler) {
    auto registry = std::make_unique<LimiterRegistry>(std::move(scheduler));

    for (const auto& limiter : config.limiters) {
        if (limiter.capacity <= 0 || limiter.capacity > UINT32_MAX) {
            throw std::invalid_argument(
                std::format("Limiter '{}' capacity out of range: {}", limiter.name, limiter.capacity));
        }
        AdmissionController::Config cfg;
        cfg.capacity = static_cast<uint32_t>(limiter.capacity);
        cfg.window = AdmissionController::Seconds(limiter.window_seconds);
        registry->add_limiter(limiter.name, cfg);
    }

    utils::log::info(std::format("Limiter registry ready with {} limiter(s)", registry->size()));
    return registry;
}

std::shared_ptr<AdmissionController> LimiterRegistry::add_limiter(
    const std::string& name, const AdmissionController::Config& config) {
    if (name.empty()) {
        throw std::invalid_argument("Limiter name must not be empty");
    }

    // Construct outside the lock; the constructor validates config
    auto limiter = std::make_shared<AdmissionController>(config, scheduler_);

    std::unique_lock lock(limiters_mutex_);
    auto [it, inserted] = limiters_.try_emplace(name, limiter);
    if (!inserted) {
        throw std::invalid_argument(std::format("Limiter '{}' already registered", name));
    }

    utils::log::debug(std::format("Registered limiter '{}': {} per {}s",
                                  name, config.capacity, config.window.count()));
    return it->second;
}

std::shared_ptr<AdmissionController> LimiterRegistry::get_limiter(const std::string& name) const {
    std::shared_lock lock(limiters_mutex_);
    const auto it = limiters_.find(name);
    return it == limiters_.end() ? nullptr : it->second;
}

std::vector<std::string> LimiterRegistry::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(limiters_mutex_);
        result.reserve(limiters_.size());
        for (const auto& [name, limiter] : limiters_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::pair<std::string, AdmissionController::Stats>>
LimiterRegistry::get_all_stats() const {
    std::shared_lock lock(limiters_mutex_);
    std::vector<std::pair<std::string, AdmissionController::Stats>> result;
    result.reserve(limiters_.size());
    for (const auto& [name, limiter] : limiters_) {
        result.emplace_back(name, limiter->get_stats());
    }
    return result;
}

size_t LimiterRegistry::size() const {
    std::shared_lock lock(limiters_mutex_);
    return limiters_.size();
}

} // namespace turnstile
