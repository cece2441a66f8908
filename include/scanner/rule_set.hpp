#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace promptfw {

/**
 * @brief Compile a rule's regex source
 *
 * ECMAScript syntax. A leading inline flag group "(?i)" turns on
 * case-insensitive matching; any other inline flag is rejected.
 */
[[nodiscard]] Result<std::regex> compile_pattern(const std::string& source);

/**
 * @brief A PatternRule with its regex compiled once at load time
 *
 * A rule whose source failed to compile keeps the error and never matches.
 */
struct CompiledPatternRule {
    std::string name;
    std::string source;
    Action action = Action::BLOCK;
    std::string description;
    std::optional<std::regex> regex;
    std::string compile_error;

    [[nodiscard]] bool valid() const { return regex.has_value(); }
};

/**
 * @brief Immutable, precompiled rule collection for one config generation
 */
class RuleSet {
public:
    /**
     * @brief Compile every configured rule
     * @param patterns Rules in configured order (order is kept)
     * @param default_action Action for rules that omit one
     */
    [[nodiscard]] static std::shared_ptr<const RuleSet> compile(
        const std::vector<PatternRuleConfig>& patterns,
        Action default_action);

    [[nodiscard]] const std::vector<CompiledPatternRule>& rules() const { return rules_; }
    [[nodiscard]] size_t size() const { return rules_.size(); }
    [[nodiscard]] size_t invalid_count() const { return invalid_count_; }

private:
    RuleSet() = default;

    std::vector<CompiledPatternRule> rules_;
    size_t invalid_count_ = 0;
};

} // namespace promptfw
