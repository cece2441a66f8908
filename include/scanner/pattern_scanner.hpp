#pragma once

#include "config/config_types.hpp"
#include "scanner/iscanner.hpp"
#include "scanner/rule_set.hpp"

#include <memory>
#include <string_view>

namespace promptfw {

inline constexpr std::string_view kOversizeMatchName = "Prompt Length Exceeded";

/**
 * @brief Matches raw prompt text against the configured RuleSet
 *
 * Each rule is searched anywhere in the prompt; case sensitivity is
 * whatever the rule's pattern asks for. Rules that failed to compile, or
 * whose match aborts inside the regex engine, are treated as not matching.
 * One ScanMatch per matching rule, in configured order.
 *
 * Only the first max_prompt_length bytes reach the regex engine. A longer
 * prompt is cut on a code point boundary and reported first as a
 * "Prompt Length Exceeded" match carrying oversize_action.
 */
class PatternScanner final : public IScanner {
public:
    PatternScanner(PatternScannerConfig config, std::shared_ptr<const RuleSet> rules);

    [[nodiscard]] bool enabled() const override { return config_.enabled; }
    [[nodiscard]] ScanResult scan(std::string_view prompt) const override;
    [[nodiscard]] std::string name() const override { return "Pattern Scanner"; }

    [[nodiscard]] const RuleSet& rules() const { return *rules_; }

private:
    [[nodiscard]] ScanMatch oversize_match(size_t prompt_size) const;

    PatternScannerConfig config_;
    std::shared_ptr<const RuleSet> rules_;
};

} // namespace promptfw
