#include "scanner/morse_code_scanner.hpp"
#include "scanner/morse_decoder.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace promptfw {

namespace {

SuspiciousContentRule make_rule(std::string name, const char* pattern, Action action,
                                std::string description) {
    return SuspiciousContentRule{
        std::move(name),
        std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize),
        action,
        std::move(description)};
}

} // anonymous namespace

const std::vector<SuspiciousContentRule>& suspicious_content_rules() {
    static const std::vector<SuspiciousContentRule> rules = [] {
        std::vector<SuspiciousContentRule> r;
        r.push_back(make_rule(
            "Morse Code Injection Attempt",
            R"((ignore\s+(all\s+)?(previous|above)\s+(instructions|prompts|rules)|forget\s+(everything|all|previous)))",
            Action::BLOCK,
            "Detected instruction override attempt hidden in morse code"));
        r.push_back(make_rule(
            "Morse Code Role Override",
            R"((you\s+are\s+now|act\s+as\s+if|pretend\s+to\s+be|roleplay\s+as))",
            Action::WARN,
            "Detected role override attempt hidden in morse code"));
        r.push_back(make_rule(
            "Morse Code System Prompt Extraction",
            R"((show\s+me\s+your|what\s+is\s+your|reveal\s+your)\s+(system\s+prompt|instructions|rules))",
            Action::BLOCK,
            "Detected system prompt extraction attempt hidden in morse code"));
        r.push_back(make_rule(
            "Morse Code Jailbreak Attempt",
            R"((jailbreak|dan\s+mode|developer\s+mode|god\s+mode|admin\s+mode))",
            Action::BLOCK,
            "Detected jailbreak attempt hidden in morse code"));
        r.push_back(make_rule(
            "Morse Code Harmful Content",
            R"((how\s+to\s+(kill|murder|harm|hurt)|instructions\s+for\s+(violence|weapons)))",
            Action::BLOCK,
            "Detected harmful content request hidden in morse code"));
        return r;
    }();
    return rules;
}

MorseCodeScanner::MorseCodeScanner(MorseScannerConfig config)
    : config_(std::move(config)) {}

ScanResult MorseCodeScanner::scan(std::string_view prompt) const {
    ScanResult result(name());
    if (!enabled() || prompt.empty()) {
        return result;
    }

    const auto& rules = suspicious_content_rules();
    const auto candidates = morse::extract_candidates(prompt, config_.min_morse_length);

    for (const auto& candidate : candidates) {
        const auto decoded = morse::decode(candidate.sequence, config_.max_decode_length);
        if (!decoded) continue;

        utils::log::debug(std::format("{}: candidate {} at byte {} decoded to '{}'",
                                       name(), candidate.index, candidate.byte_offset, *decoded));

        for (const auto& rule : rules) {
            if (!std::regex_search(*decoded, rule.pattern)) continue;

            ScanMatch match;
            match.name = rule.name;
            match.action = rule.action;
            match.description = rule.description;
            match.metadata.scanner_type = std::string(kScannerTypeMorse);
            match.metadata.morse_sequence = candidate.sequence;
            match.metadata.decoded_text = *decoded;
            match.metadata.original_position = candidate.index;
            match.metadata.byte_offset = candidate.byte_offset;
            result.matches.emplace_back(std::move(match));
        }
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
