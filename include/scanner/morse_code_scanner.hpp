#pragma once

#include "config/config_types.hpp"
#include "scanner/iscanner.hpp"

#include <regex>
#include <string>
#include <vector>

namespace promptfw {

/**
 * @brief Built-in rule applied to decoded morse text
 */
struct SuspiciousContentRule {
    std::string name;
    std::regex pattern;
    Action action = Action::BLOCK;
    std::string description;
};

/**
 * @brief Fixed rule list (instruction override, role override, system prompt
 * extraction, jailbreak, harmful content). Compiled on first use.
 */
[[nodiscard]] const std::vector<SuspiciousContentRule>& suspicious_content_rules();

/**
 * @brief Steganographic scanner: finds morse-encoded text in a prompt,
 * decodes it and matches the decoded text against suspicious_content_rules()
 *
 * Every rule that matches a decoded candidate yields one ScanMatch carrying
 * the morse sequence, decoded text and candidate position.
 */
class MorseCodeScanner final : public IScanner {
public:
    explicit MorseCodeScanner(MorseScannerConfig config);

    [[nodiscard]] bool enabled() const override { return config_.enabled; }
    [[nodiscard]] ScanResult scan(std::string_view prompt) const override;
    [[nodiscard]] std::string name() const override { return "Morse Code Scanner"; }

    [[nodiscard]] const MorseScannerConfig& config() const { return config_; }

private:
    MorseScannerConfig config_;
};

} // namespace promptfw
