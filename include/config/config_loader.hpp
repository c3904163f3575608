#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace turnstile {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads limiter definitions from TOML
 *
 * Layout:
 *   [logging]
 *   level = "info"
 *
 *   [[limiters]]
 *   name = "api"
 *   capacity = 5
 *   window_seconds = 60.0
 *
 * String values may reference environment variables as ${VAR_NAME}.
 * Errors are reported through LoadResult, never thrown.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        TurnstileConfig config;

        static LoadResult ok(TurnstileConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to turnstile.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a parsed config; one message per problem
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const TurnstileConfig& config);

    /**
     * @brief Apply the [logging] section to the process-wide logger
     * @return false if the level name is not recognised (level unchanged)
     */
    static bool apply_logging(const LoggingConfig& config);

private:
    static TurnstileConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static std::vector<LimiterConfig> extract_limiters(const toml::table& root);
    static LoadResult validate_and_return(TurnstileConfig config);
};

} // namespace turnstile
