#include "scanner/pattern_scanner.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptfw {

PatternScanner::PatternScanner(PatternScannerConfig config, std::shared_ptr<const RuleSet> rules)
    : config_(std::move(config)),
      rules_(rules ? std::move(rules) : RuleSet::compile({}, Action::BLOCK)) {}

ScanMatch PatternScanner::oversize_match(size_t prompt_size) const {
    ScanMatch match;
    match.name = std::string(kOversizeMatchName);
    match.action = config_.oversize_action;
    match.description = std::format(
        "Prompt is {} bytes; only the first {} were checked against pattern rules",
        prompt_size, config_.max_prompt_length);
    match.metadata.scanner_type = std::string(kScannerTypeRegex);
    return match;
}

ScanResult PatternScanner::scan(std::string_view prompt) const {
    ScanResult result(name());
    if (!enabled() || prompt.empty()) {
        return result;
    }

    const std::string_view window = utils::utf8_prefix_bytes(prompt, config_.max_prompt_length);
    if (window.size() < prompt.size()) {
        utils::log::warn(std::format("{}: prompt of {} bytes cut to {} before matching",
                                      name(), prompt.size(), window.size()));
        result.matches.push_back(oversize_match(prompt.size()));
    }

    for (const auto& rule : rules_->rules()) {
        if (!rule.valid()) continue;

        bool matched = false;
        try {
            matched = std::regex_search(window.begin(), window.end(), *rule.regex);
        } catch (const std::regex_error& e) {
            // error_complexity from pathological backtracking
            utils::log::error(std::format("Pattern '{}' aborted during match: {}",
                                           rule.name, e.what()));
            continue;
        }
        if (!matched) continue;

        ScanMatch match;
        match.name = rule.name;
        match.action = rule.action;
        match.description = rule.description;
        match.metadata.scanner_type = std::string(kScannerTypeRegex);
        match.metadata.pattern = rule.source;
        result.matches.emplace_back(std::move(match));
    }

    if (result.has_matches()) {
        utils::log::info(std::format("{} found {} matches in prompt",
                                      name(), result.matches.size()));
    } else {
        utils::log::debug(std::format("{} found no matches in prompt", name()));
    }
    return result;
}

} // namespace promptfw
