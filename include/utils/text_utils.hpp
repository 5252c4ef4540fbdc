#pragma once

#include <string>
#include <vector>

namespace clinscribe {
namespace utils {

/**
 * A word or punctuation token with its byte span in the source text.
 * Word text is lowercased; punctuation tokens hold the single character.
 */
struct TextToken {
    std::string text;
    size_t begin = 0;
    size_t end = 0;
    bool is_punctuation = false;
};

std::string toLower(const std::string& text);
std::string trim(const std::string& text);
bool isBlank(const std::string& text);
std::string capitalizeFirst(const std::string& text);
std::string collapseWhitespace(const std::string& text);

/**
 * Split on runs of whitespace, keeping tokens verbatim
 */
std::vector<std::string> splitWhitespace(const std::string& text);

/**
 * Lowercased alphanumeric words with punctuation stripped
 */
std::vector<std::string> extractWords(const std::string& text);

/**
 * Words and clause punctuation (, ; : . ! ?) with byte offsets. Characters
 * '/', '\'' and '-' inside a word are kept so "7/10" stays one token.
 */
std::vector<TextToken> tokenizeWithOffsets(const std::string& text);

/**
 * Split into sentences on '.', '!', '?' or newline when followed by
 * whitespace or end of text. Returned sentences are trimmed and keep their
 * terminal punctuation.
 */
std::vector<std::string> splitSentences(const std::string& text);

/**
 * Case-sensitive search for needle in haystack where the match is not
 * preceded or followed by an alphanumeric character.
 * Returns std::string::npos when absent.
 */
size_t findWholeWord(const std::string& haystack, const std::string& needle, size_t from = 0);

bool containsWholeWord(const std::string& haystack, const std::string& needle);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

/**
 * "a", "a and b", "a, b, and c"
 */
std::string joinNatural(const std::vector<std::string>& parts);

/**
 * Parses digits or number words ("two", "a few") into an integer.
 * Returns -1 if not a number.
 */
int parseNumberWord(const std::string& word);

} // namespace utils
} // namespace clinscribe
