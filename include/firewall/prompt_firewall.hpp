#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "scanner/iscanner.hpp"
#include "scanner/rule_set.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace promptfw {

/**
 * @brief Builds the scanner list for a configuration snapshot
 *
 * Order of the returned list is the order results appear in the verdict.
 */
using ScannerFactory = std::function<std::vector<std::shared_ptr<const IScanner>>(
    const FirewallConfig&, std::shared_ptr<const RuleSet>)>;

/**
 * @brief Pattern Scanner followed by Morse Code Scanner
 */
[[nodiscard]] std::vector<std::shared_ptr<const IScanner>> default_scanner_factory(
    const FirewallConfig& config, std::shared_ptr<const RuleSet> rules);

/**
 * @brief Prompt firewall: runs every enabled scanner over a prompt and
 * aggregates the matches into one verdict (most severe action wins)
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr). Each filter()
 * call loads one immutable Snapshot and uses it for the whole prompt, so a
 * concurrent reload never mixes old and new rules inside one verdict.
 * reload() is serialized by a mutex (single writer).
 */
class PromptFirewall {
public:
    /**
     * @brief Immutable view of config + compiled rules + scanners
     */
    struct Snapshot {
        FirewallConfig config;
        std::shared_ptr<const RuleSet> rules;
        std::vector<std::shared_ptr<const IScanner>> scanners;
        uint64_t generation = 0;
    };

    explicit PromptFirewall(FirewallConfig config,
                            ScannerFactory factory = default_scanner_factory);

    /**
     * @brief Scan one prompt and return the aggregated verdict
     *
     * A scanner that throws is isolated: its ScanResult carries the error
     * and contributes no matches.
     */
    [[nodiscard]] FilterResult filter(std::string_view prompt) const;

    /**
     * @brief Filter several prompts; blank prompts become error entries
     */
    [[nodiscard]] BatchFilterResult filter_batch(const std::vector<std::string>& prompts) const;

    /**
     * @brief Hot reload (RCU update). In-flight filter() calls finish on the
     * snapshot they started with.
     */
    void reload(FirewallConfig config);

    /**
     * @brief Copy of the pattern rules in effect
     */
    [[nodiscard]] std::vector<PatternRuleConfig> active_rules() const;

    /**
     * @brief Copy of the configuration in effect; mutating it has no effect
     */
    [[nodiscard]] FirewallConfig active_config() const;

    [[nodiscard]] bool enabled() const;
    [[nodiscard]] uint64_t generation() const;

    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const {
        return snapshot_.load(std::memory_order_acquire);
    }

private:
    [[nodiscard]] std::shared_ptr<const Snapshot> build_snapshot(
        FirewallConfig config, uint64_t generation) const;

    ScannerFactory factory_;

    // RCU: readers load the snapshot atomically, writers build offline and swap
    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;

    // Mutex for reload (single writer)
    mutable std::mutex reload_mutex_;
};

/**
 * @brief Verdict message for an aggregated action
 * @return std::nullopt for ALLOW
 */
[[nodiscard]] std::optional<std::string> verdict_message(
    Action action, const std::vector<MatchedPattern>& matches);

} // namespace promptfw
