#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptfw {

// ============================================================================
// Action / Severity
// ============================================================================

// Declaration order is the severity order: ALLOW < LOG < WARN < BLOCK
enum class Action : uint8_t {
    ALLOW,
    LOG,
    WARN,
    BLOCK
};

[[nodiscard]] inline constexpr int severity_rank(Action action) noexcept {
    switch (action) {
        case Action::ALLOW: return 0;
        case Action::LOG:   return 1;
        case Action::WARN:  return 2;
        case Action::BLOCK: return 3;
    }
    return 0;
}

[[nodiscard]] inline constexpr const char* action_to_string(Action action) noexcept {
    switch (action) {
        case Action::ALLOW: return "allow";
        case Action::LOG:   return "log";
        case Action::WARN:  return "warn";
        case Action::BLOCK: return "block";
    }
    return "allow";
}

/**
 * @brief Parse an action name (case-insensitive)
 * @return std::nullopt for names outside allow/log/warn/block
 */
[[nodiscard]] std::optional<Action> parse_action(std::string_view name);

/**
 * @brief Returns whichever action is more severe; ties keep `current`
 */
[[nodiscard]] inline constexpr Action escalate(Action current, Action candidate) noexcept {
    return severity_rank(candidate) > severity_rank(current) ? candidate : current;
}

// ============================================================================
// Scan Matches
// ============================================================================

inline constexpr std::string_view kScannerTypeRegex = "regex";
inline constexpr std::string_view kScannerTypeMorse = "morse_code";

/**
 * @brief Rule-specific diagnostic data attached to a match
 *
 * Pattern rules fill `pattern`; morse rules fill the sequence, decoded
 * text, the candidate's ordinal among all candidates of the prompt
 * (`original_position`) and where its run starts (`byte_offset`).
 */
struct MatchMetadata {
    std::string scanner_type;
    std::optional<std::string> pattern;
    std::optional<std::string> morse_sequence;
    std::optional<std::string> decoded_text;
    std::optional<size_t> original_position;
    std::optional<size_t> byte_offset;
};

/**
 * @brief One rule that fired during a scan. Never modified once emitted.
 */
struct ScanMatch {
    std::string name;
    Action action = Action::ALLOW;
    std::string description;
    MatchMetadata metadata;
};

/**
 * @brief One scanner's output for one prompt
 */
struct ScanResult {
    std::string scanner_name;
    std::vector<ScanMatch> matches;
    std::optional<std::string> error;   // Set when the scanner faulted

    ScanResult() = default;
    explicit ScanResult(std::string name) : scanner_name(std::move(name)) {}
    ScanResult(std::string name, std::vector<ScanMatch> m)
        : scanner_name(std::move(name)), matches(std::move(m)) {}

    [[nodiscard]] bool has_matches() const { return !matches.empty(); }
};

// ============================================================================
// Verdict
// ============================================================================

/**
 * @brief A match as reported in the verdict's flattened list
 */
struct MatchedPattern {
    std::string name;
    std::optional<std::string> pattern;
    Action action = Action::ALLOW;
    std::string description;
    MatchMetadata metadata;

    MatchedPattern() = default;
    explicit MatchedPattern(const ScanMatch& match)
        : name(match.name),
          pattern(match.metadata.pattern),
          action(match.action),
          description(match.description),
          metadata(match.metadata) {}
};

/**
 * @brief Final decision for one prompt
 *
 * Invariants: `action` is the most severe action among `matched_patterns`
 * (ALLOW when empty), and `allowed == (action != BLOCK)`.
 */
struct FilterResult {
    bool allowed = true;
    Action action = Action::ALLOW;
    std::vector<MatchedPattern> matched_patterns;
    std::optional<std::string> message;
    std::vector<ScanResult> scanner_results;

    [[nodiscard]] bool blocked() const { return !allowed; }
};

/**
 * @brief One entry of a batch filter call
 *
 * Exactly one of `result` and `error` is set.
 */
struct BatchEntry {
    size_t index = 0;
    std::optional<FilterResult> result;
    std::optional<std::string> error;
};

struct BatchSummary {
    size_t total = 0;
    size_t allowed = 0;
    size_t blocked = 0;
    size_t errors = 0;
};

struct BatchFilterResult {
    std::vector<BatchEntry> results;
    BatchSummary summary;
};

} // namespace promptfw
