#pragma once

#include "clinical/clinical_types.hpp"
#include "fusion/domain_lexicon.hpp"
#include "utils/json_utils.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clinscribe {
namespace clinical {

/**
 * A surface phrase of a clinical term. Phrases are stored lowercased.
 */
struct VocabularyTerm {
    std::string phrase;
    std::string canonical;
    EntityKind kind;
    std::string category;

    VocabularyTerm() : kind(EntityKind::SYMPTOM) {}
    VocabularyTerm(const std::string& p, const std::string& c, EntityKind k, const std::string& cat)
        : phrase(p), canonical(c), kind(k), category(cat) {}
};

// Ordered (phrase, normalized value) pairs
using PhraseTable = std::vector<std::pair<std::string, std::string>>;

/**
 * Matches one extracted entity. Empty category or name match anything.
 * min_elapsed_days requires elapsed_days strictly greater than the value.
 */
struct EntityPattern {
    EntityKind kind;
    std::string category;
    std::string name;
    std::optional<EntityStatus> status;
    bool allow_negated;
    std::optional<int> min_elapsed_days;

    EntityPattern() : kind(EntityKind::SYMPTOM), allow_negated(false) {}

    bool matches(const ClinicalEntity& entity) const;
};

/**
 * A derived risk factor produced when every pattern matches some entity
 */
struct RiskRule {
    std::string id;
    std::vector<EntityPattern> patterns;
    std::string output_name;
    std::string severity_label;
    std::string category;
    // Differential diagnosis moved up when the rule fires
    std::string promotes;
    std::string plan_item;
};

struct DifferentialTemplate {
    std::string diagnosis;
    std::string icd10;
    std::string likelihood;
    std::vector<std::string> supporting;
    std::vector<std::string> workup;
};

/**
 * Everything the section builder knows about one chief complaint
 */
struct ComplaintProfile {
    std::string complaint;
    std::vector<std::string> expected_findings;
    std::vector<DifferentialTemplate> differentials;
    std::string mdm_focus;
    std::string discharge_instructions;
};

/**
 * Read-only clinical lookup tables shared by the extractor and section
 * builder. Built once at startup and passed around as
 * std::shared_ptr<const VocabularyStore>.
 */
class VocabularyStore : public fusion::DomainLexicon {
public:
    VocabularyStore() = default;
    ~VocabularyStore() override = default;

    static std::shared_ptr<const VocabularyStore> createDefault();

    /**
     * Built-in tables extended with the terms, rules and profiles of a JSON
     * file. Throws VocabularyLoadException on unreadable or invalid input.
     */
    static std::shared_ptr<const VocabularyStore> loadFromFile(const std::string& path);

    void loadDefaults();
    void mergeJson(const utils::JsonValue& root, const std::string& source = "");

    void addTerm(const VocabularyTerm& term);
    void addRiskRule(const RiskRule& rule);
    void addComplaintProfile(const ComplaintProfile& profile);

    // Longest phrase first, ties in insertion order
    const std::vector<VocabularyTerm>& getTerms() const { return terms_; }
    const std::vector<RiskRule>& getRiskRules() const { return risk_rules_; }
    const std::vector<ComplaintProfile>& getComplaintProfiles() const { return profiles_; }

    const ComplaintProfile* findComplaintProfile(const std::string& complaint) const;
    const VocabularyTerm* findCanonical(EntityKind kind, const std::string& canonical) const;

    const PhraseTable& severityTable() const { return severity_; }
    const PhraseTable& qualityTable() const { return quality_; }
    const PhraseTable& locationTable() const { return location_; }
    const PhraseTable& routeTable() const { return route_; }
    const PhraseTable& frequencyTable() const { return frequency_; }
    const PhraseTable& dispositionTable() const { return disposition_; }
    const PhraseTable& examTable() const { return exam_; }

    size_t termCount() const { return terms_.size(); }

    // fusion::DomainLexicon
    size_t countDomainTerms(const std::string& text) const override;

private:
    static void addPhrase(PhraseTable& table, const std::string& phrase, const std::string& value);
    static EntityPattern parsePattern(const utils::JsonValue& value, const std::string& source);
    static EntityKind parseKind(const std::string& name, const std::string& source);

    std::vector<VocabularyTerm> terms_;
    std::vector<RiskRule> risk_rules_;
    std::vector<ComplaintProfile> profiles_;

    PhraseTable severity_;
    PhraseTable quality_;
    PhraseTable location_;
    PhraseTable route_;
    PhraseTable frequency_;
    PhraseTable disposition_;
    PhraseTable exam_;
};

using VocabularyStorePtr = std::shared_ptr<const VocabularyStore>;

} // namespace clinical
} // namespace clinscribe
