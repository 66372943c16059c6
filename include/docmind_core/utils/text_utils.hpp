#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docmind_core::text {

// Strips leading and trailing ASCII whitespace
std::string trim(std::string_view text);

// UTF-8 <-> code point conversion. Invalid byte sequences are replaced with U+FFFD.
std::u32string to_code_points(std::string_view text);
std::string from_code_points(std::u32string_view code_points);

// Length of a UTF-8 string in code points
size_t code_point_length(std::string_view text);

// First max_code_points code points of text, never cutting a multi-byte sequence
std::string truncate(std::string_view text, size_t max_code_points);

/**
 * @brief Lower-cases ASCII, Latin-1 and Cyrillic letters; other code points pass through.
 */
std::string to_lower(std::string_view text);

/**
 * @brief Splits text into lower-cased words on whitespace and punctuation.
 *
 * ASCII punctuation, general punctuation quotes, inverted marks and the CJK
 * full-width punctuation blocks all act as separators.
 */
std::vector<std::string> tokenize_words(std::string_view text);

}  // namespace docmind_core::text
