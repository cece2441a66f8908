#include "firewall/prompt_firewall.hpp"
#include "firewall/verdict_logger.hpp"
#include "scanner/morse_code_scanner.hpp"
#include "scanner/pattern_scanner.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace promptfw {

// ============================================================================
// Scanner Factory
// ============================================================================

std::vector<std::shared_ptr<const IScanner>> default_scanner_factory(
    const FirewallConfig& config, std::shared_ptr<const RuleSet> rules) {
    std::vector<std::shared_ptr<const IScanner>> scanners;
    scanners.reserve(2);
    scanners.push_back(std::make_shared<PatternScanner>(config.pattern_scanner, std::move(rules)));
    scanners.push_back(std::make_shared<MorseCodeScanner>(config.morse_code_scanner));
    return scanners;
}

// ============================================================================
// Verdict Message
// ============================================================================

std::optional<std::string> verdict_message(Action action,
                                           const std::vector<MatchedPattern>& matches) {
    const char* prefix = nullptr;
    switch (action) {
        case Action::BLOCK: prefix = "Prompt blocked due to security policy violations: "; break;
        case Action::WARN:  prefix = "Prompt flagged for review: "; break;
        case Action::LOG:   prefix = "Prompt logged for monitoring: "; break;
        case Action::ALLOW: return std::nullopt;
    }

    std::string message(prefix);
    for (size_t i = 0; i < matches.size(); ++i) {
        if (i > 0) message += ", ";
        message += matches[i].name;
    }
    return message;
}

// ============================================================================
// PromptFirewall
// ============================================================================

PromptFirewall::PromptFirewall(FirewallConfig config, ScannerFactory factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("PromptFirewall requires a scanner factory");
    }
    snapshot_.store(build_snapshot(std::move(config), 1), std::memory_order_release);
}

std::shared_ptr<const PromptFirewall::Snapshot> PromptFirewall::build_snapshot(
    FirewallConfig config, uint64_t generation) const {
    auto snap = std::make_shared<Snapshot>();
    snap->rules = RuleSet::compile(config.patterns, config.default_action);
    snap->scanners = factory_(config, snap->rules);
    snap->config = std::move(config);
    snap->generation = generation;

    utils::log::info(std::format("Firewall snapshot {}: {} rules ({} invalid), {} scanners",
        generation, snap->rules->size(), snap->rules->invalid_count(), snap->scanners.size()));
    return snap;
}

FilterResult PromptFirewall::filter(std::string_view prompt) const {
    const auto snap = snapshot_.load(std::memory_order_acquire);
    const utils::Timer timer;

    FilterResult result;
    if (!snap->config.enabled) {
        return result;
    }

    for (const auto& scanner : snap->scanners) {
        if (!scanner->enabled()) continue;

        ScanResult scan;
        try {
            scan = scanner->scan(prompt);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Scanner '{}' failed: {}", scanner->name(), e.what()));
            scan = ScanResult(scanner->name());
            scan.error = e.what();
        }

        for (const auto& match : scan.matches) {
            result.action = escalate(result.action, match.action);
            result.matched_patterns.emplace_back(match);
        }
        result.scanner_results.emplace_back(std::move(scan));
    }

    result.allowed = result.action != Action::BLOCK;
    result.message = verdict_message(result.action, result.matched_patterns);

    utils::log::debug(std::format("Filtered {} byte prompt in {}us: {} ({} matches)",
        prompt.size(), timer.elapsed_us().count(), action_to_string(result.action),
        result.matched_patterns.size()));
    log_verdict(snap->config.logging, prompt, result);
    return result;
}

BatchFilterResult PromptFirewall::filter_batch(const std::vector<std::string>& prompts) const {
    BatchFilterResult batch;
    batch.results.reserve(prompts.size());
    batch.summary.total = prompts.size();

    for (size_t i = 0; i < prompts.size(); ++i) {
        BatchEntry entry;
        entry.index = i;

        if (utils::is_blank(prompts[i])) {
            entry.error = "Prompt cannot be empty";
            ++batch.summary.errors;
        } else {
            entry.result = filter(prompts[i]);
            if (entry.result->allowed) {
                ++batch.summary.allowed;
            } else {
                ++batch.summary.blocked;
            }
        }
        batch.results.emplace_back(std::move(entry));
    }
    return batch;
}

void PromptFirewall::reload(FirewallConfig config) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    const auto current = snapshot_.load(std::memory_order_acquire);
    auto next = build_snapshot(std::move(config), current->generation + 1);
    snapshot_.store(std::move(next), std::memory_order_release);
    utils::log::info(std::format("Firewall configuration reloaded (generation {})",
                                  current->generation + 1));
}

std::vector<PatternRuleConfig> PromptFirewall::active_rules() const {
    return snapshot_.load(std::memory_order_acquire)->config.patterns;
}

FirewallConfig PromptFirewall::active_config() const {
    return snapshot_.load(std::memory_order_acquire)->config;
}

bool PromptFirewall::enabled() const {
    return snapshot_.load(std::memory_order_acquire)->config.enabled;
}

uint64_t PromptFirewall::generation() const {
    return snapshot_.load(std::memory_order_acquire)->generation;
}

} // namespace promptfw
