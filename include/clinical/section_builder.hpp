#pragma once

#include "clinical/clinical_types.hpp"
#include "clinical/negation_detector.hpp"
#include "clinical/vocabulary_store.hpp"
#include <string>
#include <vector>

namespace clinscribe {
namespace clinical {

/**
 * Assembles a ClinicalAssessment from extracted entities and deduplicated
 * sentences using the vocabulary's rule tables. Deterministic: the same
 * inputs always produce the same assessment.
 */
class SectionBuilder {
public:
    explicit SectionBuilder(VocabularyStorePtr vocabulary, size_t max_hpi_sentences = 6);

    ClinicalAssessment build(const std::vector<ClinicalEntity>& entities,
                             const std::vector<FusedSentence>& sentences,
                             const std::string& transcript) const;

    /**
     * First positive, unresolved symptom that has a complaint profile;
     * otherwise the first positive symptom; nullptr without symptoms
     */
    const ClinicalEntity* selectChiefComplaint(const std::vector<ClinicalEntity>& entities) const;

    /**
     * Explicitly denied symptoms followed by the complaint's expected
     * findings that were not confirmed positive
     */
    std::vector<std::string> pertinentNegatives(const std::string& complaint,
                                                const std::vector<ClinicalEntity>& entities) const;

    std::vector<Differential> rankDifferentials(const ClinicalEntity* complaint,
                                                const std::vector<ClinicalEntity>& entities,
                                                const std::vector<RiskRule>& fired) const;

    RiskLevel assessRiskLevel(const ClinicalEntity* complaint,
                              const std::vector<ClinicalEntity>& entities) const;

    // OLDCARTS letters present in the history, in OLDCARTS order
    static std::vector<std::string> hpiElements(const ClinicalEntity* complaint,
                                                const std::vector<ClinicalEntity>& entities,
                                                const std::string& transcript);

    std::string findDisposition(const std::string& transcript) const;

private:
    std::string buildHpi(const ClinicalEntity* complaint, const ClinicalAssessment& assessment,
                         const std::vector<ClinicalEntity>& entities,
                         const std::vector<FusedSentence>& sentences) const;
    std::string buildMdm(const ClinicalEntity* complaint, const ClinicalAssessment& assessment) const;
    std::vector<std::string> buildPlan(const ClinicalAssessment& assessment,
                                       const std::vector<RiskRule>& fired) const;
    void buildReviewOfSystems(ClinicalAssessment& assessment,
                              const std::vector<ClinicalEntity>& entities) const;
    void buildPhysicalExam(ClinicalAssessment& assessment, const std::string& transcript) const;
    void buildHistory(ClinicalAssessment& assessment, const std::vector<ClinicalEntity>& entities,
                      const std::string& transcript) const;
    void buildClosing(ClinicalAssessment& assessment, const std::string& transcript) const;

    static std::string describeMedication(const ClinicalEntity& medication);
    static bool isSevere(const ClinicalEntity& entity);

    VocabularyStorePtr vocabulary_;
    size_t max_hpi_sentences_;
    NegationDetector negation_;
};

} // namespace clinical
} // namespace clinscribe
