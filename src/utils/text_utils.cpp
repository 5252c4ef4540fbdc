#include "utils/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace clinscribe {
namespace utils {

namespace {

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool isClausePunctuation(char c) {
    return c == ',' || c == ';' || c == ':' || c == '.' || c == '!' || c == '?';
}

} // namespace

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        start++;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return text.substr(start, end - start);
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string capitalizeFirst(const std::string& text) {
    std::string result = text;
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::string collapseWhitespace(const std::string& text) {
    return join(splitWhitespace(text), " ");
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> extractWords(const std::string& text) {
    std::vector<std::string> words;
    for (const auto& token : tokenizeWithOffsets(text)) {
        if (token.is_punctuation) {
            continue;
        }
        std::string word;
        for (char c : token.text) {
            if (isWordChar(c)) {
                word += c;
            }
        }
        if (!word.empty()) {
            words.push_back(word);
        }
    }
    return words;
}

std::vector<TextToken> tokenizeWithOffsets(const std::string& text) {
    std::vector<TextToken> tokens;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (isWordChar(c)) {
            size_t start = i;
            while (i < text.size()) {
                char cur = text[i];
                if (isWordChar(cur)) {
                    i++;
                } else if ((cur == '/' || cur == '\'' || cur == '-') &&
                           i + 1 < text.size() && isWordChar(text[i + 1])) {
                    i++;
                } else {
                    break;
                }
            }
            TextToken token;
            token.text = toLower(text.substr(start, i - start));
            token.begin = start;
            token.end = i;
            tokens.push_back(token);
        } else {
            if (isClausePunctuation(c)) {
                TextToken token;
                token.text = std::string(1, c);
                token.begin = i;
                token.end = i + 1;
                token.is_punctuation = true;
                tokens.push_back(token);
            }
            i++;
        }
    }
    return tokens;
}

std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n') {
            std::string trimmed = trim(current);
            if (!trimmed.empty()) {
                sentences.push_back(trimmed);
            }
            current.clear();
            continue;
        }

        current += c;
        if (c == '.' || c == '!' || c == '?') {
            bool boundary = (i + 1 == text.size()) ||
                            std::isspace(static_cast<unsigned char>(text[i + 1]));
            if (boundary) {
                std::string trimmed = trim(current);
                if (!trimmed.empty()) {
                    sentences.push_back(trimmed);
                }
                current.clear();
            }
        }
    }

    std::string trimmed = trim(current);
    if (!trimmed.empty()) {
        sentences.push_back(trimmed);
    }
    return sentences;
}

size_t findWholeWord(const std::string& haystack, const std::string& needle, size_t from) {
    if (needle.empty()) {
        return std::string::npos;
    }
    size_t pos = haystack.find(needle, from);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !isWordChar(haystack[pos - 1]);
        size_t after = pos + needle.size();
        bool right_ok = after >= haystack.size() || !isWordChar(haystack[after]);
        if (left_ok && right_ok) {
            return pos;
        }
        pos = haystack.find(needle, pos + 1);
    }
    return std::string::npos;
}

bool containsWholeWord(const std::string& haystack, const std::string& needle) {
    return findWholeWord(haystack, needle) != std::string::npos;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string joinNatural(const std::vector<std::string>& parts) {
    if (parts.empty()) {
        return "";
    }
    if (parts.size() == 1) {
        return parts[0];
    }
    if (parts.size() == 2) {
        return parts[0] + " and " + parts[1];
    }
    std::vector<std::string> head(parts.begin(), parts.end() - 1);
    return join(head, ", ") + ", and " + parts.back();
}

int parseNumberWord(const std::string& word) {
    static const std::map<std::string, int> kNumbers = {
        {"a", 1}, {"an", 1}, {"one", 1}, {"two", 2}, {"three", 3}, {"four", 4},
        {"five", 5}, {"six", 6}, {"seven", 7}, {"eight", 8}, {"nine", 9},
        {"ten", 10}, {"eleven", 11}, {"twelve", 12}, {"fifteen", 15},
        {"twenty", 20}, {"thirty", 30}, {"a few", 3}, {"few", 3},
        {"several", 3}, {"a couple", 2}, {"couple", 2}
    };

    std::string lowered = toLower(trim(word));
    if (lowered.empty()) {
        return -1;
    }
    if (std::all_of(lowered.begin(), lowered.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
        if (lowered.size() > 6) {
            return -1;
        }
        return std::stoi(lowered);
    }
    auto it = kNumbers.find(lowered);
    return it != kNumbers.end() ? it->second : -1;
}

} // namespace utils
} // namespace clinscribe
