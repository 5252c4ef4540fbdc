#include "clinical/negation_detector.hpp"
#include <algorithm>

namespace clinscribe {
namespace clinical {

namespace {

const size_t kPostWindowTokens = 4;

// Words allowed between a mention and its post-cue ("troponin was negative")
bool isLinkingWord(const utils::TextToken& token) {
    static const char* const kLinking[] = {"is", "was", "were", "are", "been", "has", "have",
                                           "came", "comes", "back"};
    if (token.is_punctuation) {
        return false;
    }
    for (const char* word : kLinking) {
        if (token.text == word) {
            return true;
        }
    }
    return false;
}

} // namespace

NegationDetector::NegationDetector(size_t window_tokens)
    : window_tokens_(window_tokens) {
    for (const char* cue : {"no", "not", "deny", "denies", "denied", "denying", "without", "never",
                            "negative for", "free of", "no evidence of", "absence of",
                            "doesn't", "don't", "didn't", "hasn't", "haven't", "isn't", "wasn't"}) {
        addPreCue(cue);
    }
    for (const char* cue : {"ruled out", "negative", "absent", "not present"}) {
        addPostCue(cue);
    }
    addAdjacentCue("negative");
    for (const char* pseudo : {"no longer", "not only", "no change", "no increase", "not taking",
                               "not sure", "without difficulty"}) {
        pseudo_.push_back(utils::splitWhitespace(pseudo));
    }
    for (const char* word : {"but", "however", "although", "though", "except", "reports", "reported",
                             "complains", "endorses", "endorsed", "states", "presents", "notes",
                             "admits"}) {
        addTerminator(word);
    }
    for (const char* word : {"has", "have", "having", "had"}) {
        affirmatives_.push_back(word);
    }
}

void NegationDetector::addPreCue(const std::string& cue) {
    pre_cues_.push_back(utils::splitWhitespace(utils::toLower(cue)));
}

void NegationDetector::addPostCue(const std::string& cue) {
    post_cues_.push_back(utils::splitWhitespace(utils::toLower(cue)));
}

void NegationDetector::addAdjacentCue(const std::string& cue) {
    adjacent_cues_.push_back(utils::splitWhitespace(utils::toLower(cue)));
}

void NegationDetector::addTerminator(const std::string& word) {
    terminators_.push_back(utils::toLower(word));
}

bool NegationDetector::isScopeBreak(const utils::TextToken& token) {
    if (!token.is_punctuation) {
        return false;
    }
    return token.text == "." || token.text == "!" || token.text == "?" || token.text == ";";
}

bool NegationDetector::isTerminator(const utils::TextToken& token) const {
    if (token.is_punctuation) {
        return false;
    }
    return std::find(terminators_.begin(), terminators_.end(), token.text) != terminators_.end();
}

bool NegationDetector::endsAffirmativeScope(const std::vector<utils::TextToken>& tokens, size_t index) const {
    const auto& token = tokens[index];
    if (token.is_punctuation ||
        std::find(affirmatives_.begin(), affirmatives_.end(), token.text) == affirmatives_.end()) {
        return false;
    }
    // "don't have", "denies having" and "not had" stay inside the negation
    for (const auto& cue : pre_cues_) {
        if (cue.size() <= index && sequenceAt(tokens, index - cue.size(), index, cue)) {
            return false;
        }
    }
    return true;
}

bool NegationDetector::sequenceAt(const std::vector<utils::TextToken>& tokens, size_t index, size_t limit,
                                  const std::vector<std::string>& words) {
    if (words.empty() || index + words.size() > limit) {
        return false;
    }
    for (size_t k = 0; k < words.size(); ++k) {
        if (tokens[index + k].is_punctuation || tokens[index + k].text != words[k]) {
            return false;
        }
    }
    return true;
}

bool NegationDetector::anyAt(const std::vector<utils::TextToken>& tokens, size_t index, size_t limit,
                             const std::vector<std::vector<std::string>>& cues) const {
    for (const auto& cue : cues) {
        if (sequenceAt(tokens, index, limit, cue)) {
            return true;
        }
    }
    return false;
}

bool NegationDetector::isNegated(const std::vector<utils::TextToken>& tokens, size_t first, size_t last) const {
    if (first >= last || last > tokens.size()) {
        return false;
    }

    for (const auto& cue : adjacent_cues_) {
        if (cue.size() <= first && sequenceAt(tokens, first - cue.size(), first, cue)) {
            return true;
        }
    }

    // Walk backwards from the mention until the window or clause ends
    size_t scanned = 0;
    for (size_t i = first; i > 0 && scanned < window_tokens_; ++scanned) {
        --i;
        if (isScopeBreak(tokens[i]) || isTerminator(tokens[i]) || endsAffirmativeScope(tokens, i)) {
            break;
        }
        if (anyAt(tokens, i, first, pseudo_)) {
            continue;
        }
        // Skip the second word of a pseudo-negation ("no longer" seen from "longer")
        if (i > 0 && anyAt(tokens, i - 1, first, pseudo_)) {
            continue;
        }
        if (anyAt(tokens, i, first, pre_cues_)) {
            return true;
        }
    }

    // A post-cue belongs to the mention only when it follows directly or
    // through linking verbs, never across another phrase
    size_t post_limit = std::min(tokens.size(), last + std::min(window_tokens_, kPostWindowTokens));
    size_t i = last;
    while (i < post_limit && isLinkingWord(tokens[i])) {
        ++i;
    }
    if (i < post_limit && anyAt(tokens, i, tokens.size(), post_cues_)) {
        return true;
    }
    return false;
}

bool NegationDetector::isNegated(const std::string& text, const std::string& term) const {
    auto tokens = utils::tokenizeWithOffsets(text);
    auto term_tokens = utils::tokenizeWithOffsets(term);
    if (term_tokens.empty() || term_tokens.size() > tokens.size()) {
        return false;
    }
    for (size_t i = 0; i + term_tokens.size() <= tokens.size(); ++i) {
        bool match = true;
        for (size_t k = 0; k < term_tokens.size(); ++k) {
            if (tokens[i + k].text != term_tokens[k].text) {
                match = false;
                break;
            }
        }
        if (match) {
            return isNegated(tokens, i, i + term_tokens.size());
        }
    }
    return false;
}

} // namespace clinical
} // namespace clinscribe
