#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace turnstile {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";  // debug | info | warn | error
};

struct LimiterConfig {
    std::string name;
    int64_t capacity = 0;            // Max admissions per window (must be > 0)
    double window_seconds = 60.0;    // Rolling window length
};

struct TurnstileConfig {
    LoggingConfig logging;
    std::vector<LimiterConfig> limiters;
};

} // namespace turnstile
