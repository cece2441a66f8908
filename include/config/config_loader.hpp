#pragma once

#include "config/config_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptfw {

// Environment variable naming the active config section (e.g. "production")
inline constexpr const char* kEnvironmentVariable = "PROMPTFW_ENV";
inline constexpr const char* kDefaultEnvironment = "development";

/**
 * @brief Extracts a typed FirewallConfig from a TOML document (toml++)
 *
 * Document shape:
 *
 *   enabled = true
 *   default_action = "block"
 *
 *   [[patterns]]
 *   name = "SQL Injection"
 *   pattern = "(?i)drop\\s+table"
 *   action = "block"            # optional, falls back to default_action
 *   description = "..."
 *
 *   [pattern_scanner]    enabled, max_prompt_length, oversize_action
 *   [morse_code_scanner] enabled, min_morse_length, max_decode_length
 *   [logging]            enabled, level, log_blocked, log_allowed
 *   [config_watcher]     enabled, poll_interval_seconds
 *
 * Environment sections: if the document has a [default] table and/or a
 * table named after the environment, the effective configuration is
 * [default] deep-merged with [<environment>] (environment wins for
 * scalars, arrays are appended). Otherwise the root is used as-is.
 *
 * Every string value goes through ${VAR} environment expansion.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        FirewallConfig config;

        static LoadResult ok(FirewallConfig cfg) {
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
     * @brief Load config from a TOML file
     * @param config_path Path to the .toml file
     * @param environment Section to select; empty = $PROMPTFW_ENV or "development"
     */
    [[nodiscard]] static LoadResult load_from_file(
        const std::string& config_path,
        const std::string& environment = "");

    /**
     * @brief Load config from TOML content
     */
    [[nodiscard]] static LoadResult load_from_string(
        const std::string& toml_content,
        const std::string& environment = "");

    /**
     * @brief Load config from file, falling back to the built-in default
     *
     * A missing, unreadable or invalid file is logged and masked behind
     * default_config(); this never fails.
     */
    [[nodiscard]] static FirewallConfig load_or_default(
        const std::string& config_path,
        const std::string& environment = "");

    /**
     * @brief Built-in configuration: enabled, default_action=block, no rules
     */
    [[nodiscard]] static FirewallConfig default_config();

    /**
     * @brief Semantic checks on an extracted config
     * @return One message per violation (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const FirewallConfig& config);

    /**
     * @brief Active environment name: explicit value, else $PROMPTFW_ENV, else "development"
     */
    [[nodiscard]] static std::string resolve_environment(const std::string& environment);
};

} // namespace promptfw
