#include "scanner/morse_decoder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace promptfw::morse {

namespace {

constexpr std::array<std::pair<std::string_view, char>, 52> kCodes = {{
    {".-", 'A'},     {"-...", 'B'},   {"-.-.", 'C'},   {"-..", 'D'},
    {".", 'E'},      {"..-.", 'F'},   {"--.", 'G'},    {"....", 'H'},
    {"..", 'I'},     {".---", 'J'},   {"-.-", 'K'},    {".-..", 'L'},
    {"--", 'M'},     {"-.", 'N'},     {"---", 'O'},    {".--.", 'P'},
    {"--.-", 'Q'},   {".-.", 'R'},    {"...", 'S'},    {"-", 'T'},
    {"..-", 'U'},    {"...-", 'V'},   {".--", 'W'},    {"-..-", 'X'},
    {"-.--", 'Y'},   {"--..", 'Z'},
    {".----", '1'},  {"..---", '2'},  {"...--", '3'},  {"....-", '4'},
    {".....", '5'},  {"-....", '6'},  {"--...", '7'},  {"---..", '8'},
    {"----.", '9'},  {"-----", '0'},
    {"--..--", ','}, {".-.-.-", '.'}, {"..--..", '?'}, {"-.-.--", '!'},
    {"-....-", '-'}, {"-..-.", '/'},  {".--.-.", '@'}, {"---...", ':'},
    {"-.-..", ';'},  {"-...-", '='},  {".-.-.", '+'},  {"-.--.", '('},
    {"-.--.-", ')'}, {".-..-.", '"'}, {"...-..-", '$'}, {"..--.-", '_'},
}};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_signal(char c) {
    return c == '.' || c == '-';
}

bool is_separator(char c) {
    return c == '/' || c == '|';
}

bool in_alphabet(char c, bool allow_separators) {
    return is_signal(c) || is_space(c) || (allow_separators && is_separator(c));
}

/**
 * @brief Separators become whitespace; a 1-wide gap becomes " " and a
 * wider gap becomes "  " (word boundary). Leading/trailing gaps are dropped.
 */
std::string normalize_run(std::string_view run) {
    std::string out;
    out.reserve(run.size());

    size_t gap = 0;
    for (const char raw : run) {
        const bool blank = is_space(raw) || is_separator(raw);
        if (blank) {
            ++gap;
            continue;
        }
        if (!out.empty() && gap > 0) {
            out.append(gap >= 2 ? "  " : " ");
        }
        gap = 0;
        out += raw;
    }
    return out;
}

void scan_runs(std::string_view text, size_t min_morse_length, bool allow_separators,
               std::vector<Candidate>& out) {
    size_t i = 0;
    while (i < text.size()) {
        if (!in_alphabet(text[i], allow_separators)) {
            ++i;
            continue;
        }

        const size_t start = i;
        while (i < text.size() && in_alphabet(text[i], allow_separators)) {
            ++i;
        }

        const std::string_view run = text.substr(start, i - start);
        if (run.size() < min_morse_length || !looks_like_morse(run)) {
            continue;
        }

        std::string sequence = normalize_run(run);
        if (sequence.empty()) continue;

        size_t lead = 0;
        while (lead < run.size() && (is_space(run[lead]) || is_separator(run[lead]))) {
            ++lead;
        }
        out.push_back(Candidate{std::move(sequence), 0, start + lead});
    }
}

/**
 * @brief Split a normalized sequence into words of letter codes
 */
std::vector<std::vector<std::string_view>> split_words(std::string_view sequence) {
    std::vector<std::vector<std::string_view>> words;
    std::vector<std::string_view> current;

    size_t i = 0;
    while (i < sequence.size()) {
        size_t gap = 0;
        while (i < sequence.size() && is_space(sequence[i])) {
            ++gap;
            ++i;
        }
        if (i >= sequence.size()) break;

        if (gap >= 2 && !current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }

        const size_t start = i;
        while (i < sequence.size() && !is_space(sequence[i])) {
            ++i;
        }
        current.push_back(sequence.substr(start, i - start));
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (const char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

size_t count_real_characters(std::string_view text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return c != kPlaceholder && !is_space(c);
    }));
}

} // anonymous namespace

const std::unordered_map<std::string_view, char>& code_table() {
    static const std::unordered_map<std::string_view, char> table(kCodes.begin(), kCodes.end());
    return table;
}

char decode_letter(std::string_view code) {
    const auto& table = code_table();
    const auto it = table.find(code);
    return it != table.end() ? it->second : kPlaceholder;
}

bool looks_like_morse(std::string_view run) {
    size_t signal = 0;
    size_t visible = 0;
    for (const char c : run) {
        if (is_space(c)) continue;
        ++visible;
        if (is_signal(c)) ++signal;
    }
    if (visible == 0 || signal == 0) return false;

    return static_cast<double>(signal) / static_cast<double>(visible) > kMinSignalRatio;
}

std::vector<Candidate> extract_candidates(std::string_view text, size_t min_morse_length) {
    std::vector<Candidate> found;
    scan_runs(text, min_morse_length, false, found);
    scan_runs(text, min_morse_length, true, found);

    std::vector<Candidate> unique;
    unique.reserve(found.size());
    std::unordered_set<std::string> seen;
    for (auto& candidate : found) {
        if (seen.insert(candidate.sequence).second) {
            candidate.index = unique.size();
            unique.push_back(std::move(candidate));
        }
    }
    return unique;
}

std::optional<std::string> decode(std::string_view sequence, size_t max_decode_length) {
    if (sequence.empty() || max_decode_length == 0) return std::nullopt;

    std::string decoded;
    size_t word_count = 0;
    bool capped = false;

    for (const auto& word : split_words(sequence)) {
        if (word_count > 0) {
            if (decoded.size() + 1 > max_decode_length) break;
            decoded += ' ';
        }
        ++word_count;

        for (const auto& letter : word) {
            if (decoded.size() + 1 > max_decode_length) {
                capped = true;
                break;
            }
            decoded += decode_letter(letter);
        }
        if (capped) break;
    }

    if (word_count == 1 && decoded.size() > kBoundaryReconstructionThreshold) {
        decoded = add_word_boundaries(decoded);
        if (decoded.size() > max_decode_length) {
            decoded.resize(max_decode_length);
        }
    }
    decoded = collapse_whitespace(decoded);

    if (count_real_characters(decoded) < kMinDecodedCharacters) {
        return std::nullopt;
    }
    return decoded;
}

const std::vector<std::string_view>& boundary_words() {
    static const std::vector<std::string_view> words = [] {
        std::vector<std::string_view> w = {
            "IGNORE", "ALL", "PREVIOUS", "INSTRUCTIONS", "FORGET", "EVERYTHING",
            "JAILBREAK", "MODE", "DEVELOPER", "GOD", "ADMIN", "SHOW", "REVEAL",
            "YOUR", "SYSTEM", "PROMPT", "RULES",
        };
        std::stable_sort(w.begin(), w.end(), [](std::string_view a, std::string_view b) {
            return a.size() > b.size();
        });
        return w;
    }();
    return words;
}

std::string add_word_boundaries(std::string_view text) {
    std::string result(text);

    for (const auto word : boundary_words()) {
        std::string replaced;
        replaced.reserve(result.size() + 8);

        size_t pos = 0;
        while (pos < result.size()) {
            const size_t hit = result.find(word, pos);
            if (hit == std::string::npos) {
                replaced.append(result, pos, std::string::npos);
                break;
            }
            replaced.append(result, pos, hit - pos);
            replaced += ' ';
            replaced.append(word);
            replaced += ' ';
            pos = hit + word.size();
        }
        result = std::move(replaced);
    }

    return collapse_whitespace(result);
}

} // namespace promptfw::morse
