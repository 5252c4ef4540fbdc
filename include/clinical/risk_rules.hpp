#pragma once

#include "clinical/clinical_types.hpp"
#include "clinical/vocabulary_store.hpp"
#include <vector>

namespace clinscribe {
namespace clinical {

/**
 * Second extraction pass: applies the vocabulary's risk rule table, in
 * table order, to an extracted entity set.
 */
class RiskRuleEvaluator {
public:
    explicit RiskRuleEvaluator(VocabularyStorePtr vocabulary);

    bool ruleMatches(const RiskRule& rule, const std::vector<ClinicalEntity>& entities) const;

    std::vector<RiskRule> firedRules(const std::vector<ClinicalEntity>& entities) const;

    /**
     * One riskFactor entity per fired rule, never duplicating a risk factor
     * already present in the input
     */
    std::vector<ClinicalEntity> deriveRiskFactors(const std::vector<ClinicalEntity>& entities) const;

private:
    VocabularyStorePtr vocabulary_;
};

} // namespace clinical
} // namespace clinscribe
