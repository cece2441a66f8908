#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace promptfw {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief One configured detection rule, as authored
 *
 * `action` is empty when the rule did not name one; the scanner-level
 * default action applies then.
 */
struct PatternRuleConfig {
    std::string name;
    std::string pattern;                  // Regex source (ECMAScript, optional leading (?i))
    std::optional<Action> action;
    std::string description;
};

/// Largest max_prompt_length the loader accepts. std::regex recurses per
/// repeated character, so longer inputs can exhaust the thread's stack.
inline constexpr size_t kPromptLengthCeiling = 16384;

struct PatternScannerConfig {
    bool enabled = true;
    size_t max_prompt_length = 10000;     // Bytes handed to the regex engine
    Action oversize_action = Action::WARN; // Reported when a prompt is cut
};

struct MorseScannerConfig {
    bool enabled = true;
    size_t min_morse_length = 10;         // Shortest run considered a candidate
    size_t max_decode_length = 1000;      // Cap on decoded output per candidate
};

/**
 * @brief Verdict logging policy
 *
 * level: "debug" | "info" | "warn" | "error"
 */
struct LoggingConfig {
    bool enabled = true;
    std::string level = "info";
    bool log_blocked = true;
    bool log_allowed = false;
};

struct ConfigWatcherConfig {
    bool enabled = false;
    int poll_interval_seconds = 5;
};

/**
 * @brief One complete generation of firewall configuration
 */
struct FirewallConfig {
    bool enabled = true;
    Action default_action = Action::BLOCK;
    std::vector<PatternRuleConfig> patterns;
    PatternScannerConfig pattern_scanner;
    MorseScannerConfig morse_code_scanner;
    LoggingConfig logging;
    ConfigWatcherConfig config_watcher;
};

} // namespace promptfw
