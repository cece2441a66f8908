#include "firewall/verdict_logger.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptfw {

namespace {

std::string verdict_prefix(const FilterResult& result) {
    if (result.blocked()) {
        return std::format("BLOCKED: {}", result.message.value_or(""));
    }
    if (result.action == Action::WARN) {
        return std::format("WARNING: {}", result.message.value_or(""));
    }
    return "ALLOWED: Prompt passed firewall checks";
}

std::string verdict_summary(std::string_view prompt, const FilterResult& result,
                            bool with_preview) {
    std::string names = "[";
    for (size_t i = 0; i < result.matched_patterns.size(); ++i) {
        if (i > 0) names += ",";
        names += std::format("\"{}\"", utils::escape_json(result.matched_patterns[i].name));
    }
    names += "]";

    std::string json = std::format(
        R"({{"prompt_length":{},"action":"{}","allowed":{},"matched_patterns":{},"timestamp":"{}")",
        prompt.size(), action_to_string(result.action), utils::booltostr(result.allowed),
        names, utils::format_timestamp(utils::now()));
    if (with_preview) {
        json += std::format(R"(,"prompt_preview":"{}")",
                            utils::escape_json(utils::utf8_prefix_chars(prompt, kPromptPreviewLength)));
    }
    json += "}";
    return json;
}

} // anonymous namespace

bool should_log_verdict(const LoggingConfig& logging, const FilterResult& result) {
    if (!logging.enabled) return false;
    return (result.blocked() && logging.log_blocked) ||
           (result.allowed && logging.log_allowed);
}

std::optional<std::string> format_verdict_log(const LoggingConfig& logging,
                                              std::string_view prompt,
                                              const FilterResult& result) {
    const auto level = utils::log::parse_level(logging.level).value_or(utils::log::Level::INFO);

    switch (level) {
        case utils::log::Level::DEBUG:
        case utils::log::Level::INFO:
            break;
        case utils::log::Level::WARN:
            if (result.action == Action::ALLOW) return std::nullopt;
            break;
        case utils::log::Level::ERROR:
            if (!result.blocked()) return std::nullopt;
            break;
    }

    return std::format("{} | {}", verdict_prefix(result),
        verdict_summary(prompt, result, level == utils::log::Level::DEBUG));
}

void log_verdict(const LoggingConfig& logging, std::string_view prompt,
                 const FilterResult& result) {
    if (!should_log_verdict(logging, result)) return;

    const auto line = format_verdict_log(logging, prompt, result);
    if (!line) return;

    switch (utils::log::parse_level(logging.level).value_or(utils::log::Level::INFO)) {
        case utils::log::Level::DEBUG: utils::log::debug(*line); break;
        case utils::log::Level::INFO:  utils::log::info(*line); break;
        case utils::log::Level::WARN:  utils::log::warn(*line); break;
        case utils::log::Level::ERROR: utils::log::error(*line); break;
    }
}

} // namespace promptfw
