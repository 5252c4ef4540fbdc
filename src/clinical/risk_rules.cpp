#include "clinical/risk_rules.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace clinscribe {
namespace clinical {

RiskRuleEvaluator::RiskRuleEvaluator(VocabularyStorePtr vocabulary)
    : vocabulary_(std::move(vocabulary)) {
    if (!vocabulary_) {
        throw std::invalid_argument("RiskRuleEvaluator requires a vocabulary");
    }
}

bool RiskRuleEvaluator::ruleMatches(const RiskRule& rule, const std::vector<ClinicalEntity>& entities) const {
    if (rule.patterns.empty()) {
        return false;
    }
    for (const auto& pattern : rule.patterns) {
        bool found = std::any_of(entities.begin(), entities.end(),
                                 [&](const ClinicalEntity& e) { return pattern.matches(e); });
        if (!found) {
            return false;
        }
    }
    return true;
}

std::vector<RiskRule> RiskRuleEvaluator::firedRules(const std::vector<ClinicalEntity>& entities) const {
    std::vector<RiskRule> fired;
    for (const auto& rule : vocabulary_->getRiskRules()) {
        if (ruleMatches(rule, entities)) {
            fired.push_back(rule);
        }
    }
    return fired;
}

std::vector<ClinicalEntity> RiskRuleEvaluator::deriveRiskFactors(const std::vector<ClinicalEntity>& entities) const {
    std::vector<ClinicalEntity> derived;
    for (const auto& rule : firedRules(entities)) {
        auto same_name = [&](const ClinicalEntity& e) {
            return e.kind == EntityKind::RISK_FACTOR && e.name == rule.output_name;
        };
        if (std::any_of(entities.begin(), entities.end(), same_name) ||
            std::any_of(derived.begin(), derived.end(), same_name)) {
            continue;
        }

        ClinicalEntity risk;
        risk.kind = EntityKind::RISK_FACTOR;
        risk.name = rule.output_name;
        risk.category = rule.category;
        risk.severity = rule.severity_label;
        risk.matched_text = rule.id;

        // Anchor at the latest first-mention among the supporting entities
        size_t anchor = 0;
        for (const auto& pattern : rule.patterns) {
            for (const auto& entity : entities) {
                if (pattern.matches(entity)) {
                    anchor = std::max(anchor, entity.offset);
                    break;
                }
            }
        }
        risk.offset = anchor;

        utils::Logger::debug("Risk rule fired: " + rule.id);
        derived.push_back(risk);
    }
    return derived;
}

} // namespace clinical
} // namespace clinscribe
