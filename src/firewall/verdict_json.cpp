#include "firewall/verdict_json.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptfw {

namespace {

std::string optional_size(const std::optional<size_t>& v) {
    return v ? std::to_string(*v) : "null";
}

template <typename T>
std::string json_array(const std::vector<T>& items) {
    std::string json = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) json += ",";
        json += to_json(items[i]);
    }
    json += "]";
    return json;
}

} // anonymous namespace

std::string to_json(const MatchMetadata& metadata) {
    std::string json = std::format(R"({{"scanner_type":"{}")",
                                   utils::escape_json(metadata.scanner_type));
    if (metadata.pattern) {
        json += std::format(R"(,"pattern":"{}")", utils::escape_json(*metadata.pattern));
    }
    if (metadata.morse_sequence) {
        json += std::format(R"(,"morse_sequence":"{}")",
                            utils::escape_json(*metadata.morse_sequence));
    }
    if (metadata.decoded_text) {
        json += std::format(R"(,"decoded_text":"{}")",
                            utils::escape_json(*metadata.decoded_text));
    }
    if (metadata.original_position) {
        json += std::format(R"(,"original_position":{})",
                            optional_size(metadata.original_position));
    }
    if (metadata.byte_offset) {
        json += std::format(R"(,"byte_offset":{})", optional_size(metadata.byte_offset));
    }
    json += "}";
    return json;
}

std::string to_json(const ScanMatch& match) {
    return std::format(
        R"({{"name":"{}","action":"{}","description":"{}","metadata":{}}})",
        utils::escape_json(match.name), action_to_string(match.action),
        utils::escape_json(match.description), to_json(match.metadata));
}

std::string to_json(const MatchedPattern& match) {
    return std::format(
        R"({{"name":"{}","pattern":{},"action":"{}","description":"{}","metadata":{}}})",
        utils::escape_json(match.name), utils::json_string_or_null(match.pattern),
        action_to_string(match.action), utils::escape_json(match.description),
        to_json(match.metadata));
}

std::string to_json(const ScanResult& result) {
    std::string json = std::format(R"({{"scanner_name":"{}","matches":{})",
                                   utils::escape_json(result.scanner_name),
                                   json_array(result.matches));
    if (result.error) {
        json += std::format(R"(,"error":"{}")", utils::escape_json(*result.error));
    }
    json += "}";
    return json;
}

std::string to_json(const FilterResult& result) {
    return std::format(
        R"({{"allowed":{},"action":"{}","message":{},"matched_patterns":{},"scanner_results":{}}})",
        utils::booltostr(result.allowed), action_to_string(result.action),
        utils::json_string_or_null(result.message),
        json_array(result.matched_patterns), json_array(result.scanner_results));
}

std::string to_json(const BatchFilterResult& batch) {
    std::string json = R"({"results":[)";
    for (size_t i = 0; i < batch.results.size(); ++i) {
        if (i > 0) json += ",";
        const auto& entry = batch.results[i];
        if (entry.error) {
            json += std::format(R"({{"index":{},"error":"{}","allowed":false,"action":"error"}})",
                                entry.index, utils::escape_json(*entry.error));
        } else if (entry.result) {
            // Verdict fields with the index prepended
            json += std::format(R"({{"index":{},)", entry.index);
            json += to_json(*entry.result).substr(1);
        }
    }
    json += std::format(
        R"(],"summary":{{"total":{},"allowed":{},"blocked":{},"errors":{}}}}})",
        batch.summary.total, batch.summary.allowed, batch.summary.blocked,
        batch.summary.errors);
    return json;
}

std::string rules_to_json(const std::vector<PatternRuleConfig>& rules,
                          Action default_action, bool include_pattern) {
    std::string json = R"({"patterns":[)";
    for (size_t i = 0; i < rules.size(); ++i) {
        if (i > 0) json += ",";
        const auto& rule = rules[i];
        json += std::format(R"({{"name":"{}","action":"{}","description":"{}")",
                            utils::escape_json(rule.name),
                            action_to_string(rule.action.value_or(default_action)),
                            utils::escape_json(rule.description));
        if (include_pattern) {
            json += std::format(R"(,"pattern":"{}")", utils::escape_json(rule.pattern));
        }
        json += "}";
    }
    json += std::format(R"(],"count":{}}})", rules.size());
    return json;
}

std::string config_summary_json(const FirewallConfig& config) {
    return std::format(
        R"({{"enabled":{},"default_action":"{}","patterns_count":{},)"
        R"("pattern_scanner":{{"enabled":{},"max_prompt_length":{},"oversize_action":"{}"}},)"
        R"("morse_code_scanner":{{"enabled":{},"min_morse_length":{},"max_decode_length":{}}},)"
        R"("logging":{{"enabled":{},"level":"{}","log_blocked":{},"log_allowed":{}}},)"
        R"("config_watcher":{{"enabled":{},"poll_interval_seconds":{}}}}})",
        utils::booltostr(config.enabled), action_to_string(config.default_action),
        config.patterns.size(),
        utils::booltostr(config.pattern_scanner.enabled),
        config.pattern_scanner.max_prompt_length,
        action_to_string(config.pattern_scanner.oversize_action),
        utils::booltostr(config.morse_code_scanner.enabled),
        config.morse_code_scanner.min_morse_length,
        config.morse_code_scanner.max_decode_length,
        utils::booltostr(config.logging.enabled), utils::escape_json(config.logging.level),
        utils::booltostr(config.logging.log_blocked),
        utils::booltostr(config.logging.log_allowed),
        utils::booltostr(config.config_watcher.enabled),
        config.config_watcher.poll_interval_seconds);
}

} // namespace promptfw
