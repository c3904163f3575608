#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string_view>
#include <unordered_set>

using namespace std::string_literals;

namespace turnstile {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Replace each ${NAME} with the value of environment variable NAME.
 *
 * Unset variables expand to nothing. An unterminated "${" is an error.
 */
std::string expand_env_vars(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    size_t pos = 0;
    while (true) {
        const size_t open = input.find("${", pos);
        result.append(input.substr(pos, open - pos));
        if (open == std::string_view::npos) break;

        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            result += value;
        }
        pos = close + 1;
    }
    return result;
}

// Expands string values at any depth, including [[limiters]] entries
void expand_env_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = expand_env_vars(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) {
            expand_env_in(child);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) {
            expand_env_in(child);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_in(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_in(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

std::vector<LimiterConfig> ConfigLoader::extract_limiters(const toml::table& root) {
    std::vector<LimiterConfig> result;
    const auto* arr = root["limiters"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* l = elem.as_table();
        if (!l) continue;

        LimiterConfig cfg;
        cfg.name = (*l)["name"].value_or(""s);
        cfg.capacity = (*l)["capacity"].value_or(int64_t{0});
        cfg.window_seconds = (*l)["window_seconds"].value_or(60.0);
        result.emplace_back(std::move(cfg));
    }
    return result;
}

TurnstileConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    TurnstileConfig config;
    config.logging = extract_logging(tbl);
    config.limiters = extract_limiters(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(TurnstileConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

bool ConfigLoader::apply_logging(const LoggingConfig& config) {
    const auto level = utils::log::parse_level(config.level);
    if (!level) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level", config.level));
        return false;
    }
    utils::log::set_level(*level);
    return true;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TurnstileConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'",
            config.logging.level));
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.limiters.size(); ++i) {
        const auto& limiter = config.limiters[i];
        if (limiter.name.empty()) {
            errors.push_back(std::format("limiters[{}].name must not be empty", i));
        } else if (!seen.insert(limiter.name).second) {
            errors.push_back(std::format("limiters[{}].name '{}' is defined more than once",
                                         i, limiter.name));
        }
        if (limiter.capacity <= 0 || limiter.capacity > UINT32_MAX) {
            errors.push_back(std::format("limiters[{}].capacity must be 1-{}, got {}",
                                         i, UINT32_MAX, limiter.capacity));
        }
        if (!std::isfinite(limiter.window_seconds) || limiter.window_seconds <= 0.0) {
            errors.push_back(std::format("limiters[{}].window_seconds must be > 0, got {}",
                                         i, limiter.window_seconds));
        }
    }

    return errors;
}

} // namespace turnstile
