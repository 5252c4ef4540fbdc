#pragma once

#include "utils/text_utils.hpp"
#include <string>
#include <vector>

namespace clinscribe {
namespace clinical {

/**
 * Window-based negation scope detection over tokenized text.
 *
 * A mention is negated when a pre-cue ("denies", "no", "negative for")
 * appears within the preceding window, an adjacent cue ("negative") sits
 * directly before it, or a post-cue ("ruled out") follows it directly or
 * through linking verbs ("was negative", "came back negative").
 * Pre-cue scope ends at sentence punctuation, semicolons, clause terminators
 * ("but", "reports") and affirmative verbs ("has", "having") that are not
 * themselves negated. Pseudo-negations such as "no longer" never negate.
 */
class NegationDetector {
public:
    explicit NegationDetector(size_t window_tokens = 10);

    /**
     * True if the mention spanning tokens [first, last) is in negation scope
     */
    bool isNegated(const std::vector<utils::TextToken>& tokens, size_t first, size_t last) const;

    bool isNegated(const std::string& text, const std::string& term) const;

    void addPreCue(const std::string& cue);
    void addPostCue(const std::string& cue);
    void addAdjacentCue(const std::string& cue);
    void addTerminator(const std::string& word);

    size_t getWindowTokens() const { return window_tokens_; }
    const std::vector<std::vector<std::string>>& getPreCues() const { return pre_cues_; }
    const std::vector<std::vector<std::string>>& getPostCues() const { return post_cues_; }
    const std::vector<std::vector<std::string>>& getPseudoNegations() const { return pseudo_; }

    static bool isScopeBreak(const utils::TextToken& token);

private:
    static bool sequenceAt(const std::vector<utils::TextToken>& tokens, size_t index, size_t limit,
                           const std::vector<std::string>& words);
    bool anyAt(const std::vector<utils::TextToken>& tokens, size_t index, size_t limit,
               const std::vector<std::vector<std::string>>& cues) const;
    bool isTerminator(const utils::TextToken& token) const;
    bool endsAffirmativeScope(const std::vector<utils::TextToken>& tokens, size_t index) const;

    size_t window_tokens_;
    std::vector<std::vector<std::string>> pre_cues_;
    std::vector<std::vector<std::string>> post_cues_;
    std::vector<std::vector<std::string>> adjacent_cues_;
    std::vector<std::vector<std::string>> pseudo_;
    std::vector<std::string> terminators_;
    std::vector<std::string> affirmatives_;
};

} // namespace clinical
} // namespace clinscribe
