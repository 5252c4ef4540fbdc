#pragma once

#include "clinical/clinical_types.hpp"
#include "clinical/negation_detector.hpp"
#include "clinical/risk_rules.hpp"
#include "clinical/vocabulary_store.hpp"
#include "utils/text_utils.hpp"
#include <optional>
#include <string>
#include <vector>

namespace clinscribe {
namespace clinical {

/**
 * A timing phrase found in text with the number of days it points back
 */
struct TimingMatch {
    std::string text;
    size_t begin;
    size_t end;
    int elapsed_days;
};

/**
 * Finds vocabulary terms in transcript text and qualifies each mention with
 * negation, status and the modifiers found in its token window.
 *
 * Output order is the order of first mention; derived risk factors follow
 * the extracted entities in rule-table order. Nothing here throws for
 * absent findings.
 */
class EntityExtractor {
public:
    explicit EntityExtractor(VocabularyStorePtr vocabulary, size_t window_tokens = 10,
                             bool apply_risk_rules = true);

    std::vector<ClinicalEntity> extract(const std::string& text) const;

    // Vocabulary and timing entities without the risk rule pass
    std::vector<ClinicalEntity> extractMentions(const std::string& text) const;

    const NegationDetector& getNegationDetector() const { return negation_; }
    const RiskRuleEvaluator& getRiskRules() const { return risk_rules_; }
    size_t getWindowTokens() const { return window_tokens_; }

    /**
     * Every timing phrase in lowercased text, non-overlapping, in text order
     */
    static std::vector<TimingMatch> findTimingPhrases(const std::string& lowered);

private:
    struct Mention {
        const VocabularyTerm* term;
        size_t begin;
        size_t end;
        size_t first_token;
        size_t last_token;
    };

    struct Span {
        size_t begin;
        size_t end;
    };

    std::vector<Mention> findMentions(const std::string& lowered,
                                      const std::vector<utils::TextToken>& tokens) const;
    Span windowFor(const std::vector<utils::TextToken>& tokens, size_t first, size_t last) const;

    ClinicalEntity qualify(const Mention& mention, const std::string& text, const std::string& lowered,
                           const std::vector<utils::TextToken>& tokens,
                           const std::vector<TimingMatch>& timings) const;

    void attachSymptomModifiers(ClinicalEntity& entity, const std::string& lowered,
                                const Span& window, const Span& own) const;
    void attachMedicationModifiers(ClinicalEntity& entity, const std::string& lowered,
                                   const Span& window, const Span& own) const;
    static std::optional<std::string> durationIn(const std::vector<TimingMatch>& timings, const Span& window);

    static std::optional<std::string> findPhrase(const PhraseTable& table, const std::string& lowered,
                                                 const Span& window, const std::vector<Span>& excluded,
                                                 Span* found = nullptr);
    static bool containsCue(const std::string& lowered, const Span& window,
                            const std::vector<std::string>& cues, const Span& own);

    static std::vector<ClinicalEntity> collapse(const std::vector<ClinicalEntity>& mentions);

    VocabularyStorePtr vocabulary_;
    size_t window_tokens_;
    bool apply_risk_rules_;
    NegationDetector negation_;
    RiskRuleEvaluator risk_rules_;
    std::vector<std::string> discontinued_cues_;
    std::vector<std::string> resolved_cues_;
};

} // namespace clinical
} // namespace clinscribe
