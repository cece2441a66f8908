#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace promptfw {

// ============================================================================
// JSON rendering of verdicts, rules and configuration
// ============================================================================

[[nodiscard]] std::string to_json(const MatchMetadata& metadata);
[[nodiscard]] std::string to_json(const ScanMatch& match);
[[nodiscard]] std::string to_json(const MatchedPattern& match);
[[nodiscard]] std::string to_json(const ScanResult& result);
[[nodiscard]] std::string to_json(const FilterResult& result);
[[nodiscard]] std::string to_json(const BatchFilterResult& batch);

/**
 * @brief Public rule listing: name, action, description
 * @param include_pattern Also emit the regex source (withheld by default)
 * @param default_action Reported for rules without an explicit action
 */
[[nodiscard]] std::string rules_to_json(const std::vector<PatternRuleConfig>& rules,
                                        Action default_action,
                                        bool include_pattern = false);

/**
 * @brief Configuration summary (toggles, thresholds, rule count)
 */
[[nodiscard]] std::string config_summary_json(const FirewallConfig& config);

} // namespace promptfw
