#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptfw::morse {

/**
 * Morse extraction and decoding. Pure functions, no shared state.
 *
 * Pipeline for a prompt:
 *   extract_candidates  maximal runs over {'.', '-', whitespace} (and a second
 *                       pass also accepting '/' and '|' as separators) that are
 *                       long enough and pass looks_like_morse()
 *   decode              2+ whitespace = word gap, 1 whitespace = letter gap;
 *                       unknown letters become kPlaceholder
 *   add_word_boundaries re-segments a single long decoded token using a fixed
 *                       list of high-signal words
 */

inline constexpr char kPlaceholder = '?';

// Share of dot/dash characters among non-whitespace characters of a run
inline constexpr double kMinSignalRatio = 0.7;

// A lone decoded token longer than this is re-segmented
inline constexpr size_t kBoundaryReconstructionThreshold = 10;

// Decoded text needs this many non-placeholder characters to count
inline constexpr size_t kMinDecodedCharacters = 3;

struct Candidate {
    std::string sequence;   // Normalized: single space between letters, two between words
    size_t index = 0;       // Ordinal among the candidates returned for one text
    size_t byte_offset = 0; // Offset of the run's first non-whitespace character
};

/**
 * @brief Dot/dash code -> character table (letters, digits, punctuation)
 */
[[nodiscard]] const std::unordered_map<std::string_view, char>& code_table();

/**
 * @brief Decode one letter; kPlaceholder when the code is not in the table
 */
[[nodiscard]] char decode_letter(std::string_view code);

/**
 * @brief Heuristic: true when dots/dashes make up more than 70% of the
 * non-whitespace characters of `run`
 */
[[nodiscard]] bool looks_like_morse(std::string_view run);

/**
 * @brief Find morse candidates in arbitrary text
 *
 * Runs shorter than `min_morse_length` (raw length, whitespace included)
 * are ignored. Candidates are de-duplicated on their normalized sequence;
 * the first occurrence wins.
 */
[[nodiscard]] std::vector<Candidate> extract_candidates(std::string_view text,
                                                        size_t min_morse_length);

/**
 * @brief Decode a normalized morse sequence
 *
 * Output never exceeds `max_decode_length` characters.
 * @return std::nullopt when fewer than kMinDecodedCharacters real
 *         (non-placeholder, non-space) characters were decoded
 */
[[nodiscard]] std::optional<std::string> decode(std::string_view sequence,
                                                size_t max_decode_length);

/**
 * @brief Insert spaces around known words (longest first), collapse whitespace
 *
 * Best effort; characters outside the known words stay glued together.
 */
[[nodiscard]] std::string add_word_boundaries(std::string_view text);

/**
 * @brief Words used by add_word_boundaries, longest first
 */
[[nodiscard]] const std::vector<std::string_view>& boundary_words();

} // namespace promptfw::morse
