#include "scanner/rule_set.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace promptfw {

namespace {

struct InlineFlags {
    std::regex::flag_type flags = std::regex::ECMAScript;
    size_t prefix_length = 0;       // Bytes consumed by the "(?...)" group
};

/**
 * @brief Strip a leading "(?flags)" group and translate it to std::regex flags
 */
Result<InlineFlags> parse_inline_flags(const std::string& source) {
    InlineFlags out;
    if (source.size() < 4 || source[0] != '(' || source[1] != '?') {
        return Result<InlineFlags>::ok(out);
    }

    size_t i = 2;
    while (i < source.size() && std::isalpha(static_cast<unsigned char>(source[i]))) {
        ++i;
    }
    // Not a flag group: "(?:", "(?=", "(?!" ...
    if (i == 2 || i >= source.size() || source[i] != ')') {
        return Result<InlineFlags>::ok(out);
    }

    for (size_t j = 2; j < i; ++j) {
        if (source[j] == 'i') {
            out.flags |= std::regex::icase;
        } else {
            return Result<InlineFlags>::error(ErrorCategory::UNSUPPORTED_FLAG,
                std::format("unsupported inline flag '{}'", source[j]));
        }
    }
    out.prefix_length = i + 1;
    return Result<InlineFlags>::ok(out);
}

} // anonymous namespace

Result<std::regex> compile_pattern(const std::string& source) {
    if (source.empty()) {
        return Result<std::regex>::error(ErrorCategory::EMPTY_PATTERN, "empty pattern");
    }

    const auto flags = parse_inline_flags(source);
    if (flags.is_error()) {
        return Result<std::regex>::error(flags.error_category(), flags.error_message());
    }

    try {
        return Result<std::regex>::ok(std::regex(
            source.substr(flags.value().prefix_length),
            flags.value().flags | std::regex::optimize));
    } catch (const std::regex_error& e) {
        return Result<std::regex>::error(ErrorCategory::INVALID_REGEX, e.what());
    }
}

std::shared_ptr<const RuleSet> RuleSet::compile(
    const std::vector<PatternRuleConfig>& patterns,
    Action default_action) {

    std::shared_ptr<RuleSet> set(new RuleSet());
    set->rules_.reserve(patterns.size());

    for (const auto& cfg : patterns) {
        CompiledPatternRule rule;
        rule.name = cfg.name;
        rule.source = cfg.pattern;
        rule.action = cfg.action.value_or(default_action);
        rule.description = cfg.description;

        auto compiled = compile_pattern(cfg.pattern);
        if (compiled.is_ok()) {
            rule.regex = std::move(compiled.value());
        } else {
            rule.compile_error = compiled.error_message();
            ++set->invalid_count_;
            utils::log::error(std::format("Invalid regex pattern '{}' in rule '{}': {} ({}, rule disabled)",
                                           cfg.pattern, cfg.name, rule.compile_error,
                                           error_category_to_string(compiled.error_category())));
        }

        set->rules_.emplace_back(std::move(rule));
    }

    return set;
}

} // namespace promptfw
