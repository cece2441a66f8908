#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace promptfw {

// Code points of the prompt echoed at debug level
inline constexpr size_t kPromptPreviewLength = 101;

/**
 * @brief Whether the logging policy selects this verdict at all
 *
 * (blocked && log_blocked) || (allowed && log_allowed), and never when
 * logging is disabled.
 */
[[nodiscard]] bool should_log_verdict(const LoggingConfig& logging, const FilterResult& result);

/**
 * @brief Render the verdict log line, or std::nullopt when the configured
 * level suppresses it (warn: non-allow only, error: blocked only)
 *
 * Format: "BLOCKED: <message> | {json}". The JSON carries prompt_length,
 * action, allowed, matched pattern names and a timestamp; prompt_preview is
 * added at level debug.
 */
[[nodiscard]] std::optional<std::string> format_verdict_log(
    const LoggingConfig& logging, std::string_view prompt, const FilterResult& result);

/**
 * @brief Apply the policy and emit through utils::log at the configured level
 */
void log_verdict(const LoggingConfig& logging, std::string_view prompt, const FilterResult& result);

} // namespace promptfw
