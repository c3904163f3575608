#pragma once

#include "config/config_types.hpp"
#include "limiter/admission_controller.hpp"
#include "scheduler/ischeduler.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace turnstile {

/**
 * @brief Named set of limiters sharing one scheduler
 *
 * One AdmissionController per configured rate. Lookups take a shared lock
 * (read-mostly); registration takes a unique lock.
 */
class LimiterRegistry {
public:
    explicit LimiterRegistry(std::shared_ptr<IScheduler> scheduler);

    /**
     * @brief Build a registry with one limiter per [[limiters]] entry
     * @throws std::invalid_argument on a bad or duplicate definition
     */
    [[nodiscard]] static std::unique_ptr<LimiterRegistry> from_config(
        const TurnstileConfig& config, std::shared_ptr<IScheduler> scheduler);

    /**
     * @brief Register a new limiter
     * @return The created limiter (never null)
     * @throws std::invalid_argument on empty or duplicate name, or bad config
     */
    std::shared_ptr<AdmissionController> add_limiter(
        const std::string& name, const AdmissionController::Config& config);

    /**
     * @return Limiter registered under `name`, or nullptr
     */
    [[nodiscard]] std::shared_ptr<AdmissionController> get_limiter(const std::string& name) const;

    /**
     * @brief Registered names, sorted
     */
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::vector<std::pair<std::string, AdmissionController::Stats>> get_all_stats() const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] const std::shared_ptr<IScheduler>& scheduler() const { return scheduler_; }

private:
    std::shared_ptr<IScheduler> scheduler_;
    std::unordered_map<std::string, std::shared_ptr<AdmissionController>> limiters_;
    mutable std::shared_mutex limiters_mutex_;
};

} // namespace turnstile
