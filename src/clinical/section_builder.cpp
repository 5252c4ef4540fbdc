#include "clinical/section_builder.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace clinscribe {
namespace clinical {

namespace {

const size_t kMaxPlanItems = 8;
const size_t kMdmDifferentials = 3;

const std::vector<std::string> kOnsetWords = {"started", "began", "onset", "sudden", "suddenly", "came on"};
const std::vector<std::string> kModifyingWords = {"worse with", "worse when", "better with", "better when",
                                                  "relieved by", "aggravated", "exertion", "at rest",
                                                  "when i breathe", "when i walk", "lying down"};
const std::vector<std::string> kTimingWords = {"constant", "intermittent", "comes and goes", "on and off",
                                               "episodes", "all the time", "every time"};
const std::vector<std::string> kHighAcuitySystems = {"Cardiovascular", "Neurological", "Respiratory"};

bool containsAnyWord(const std::string& lowered, const std::vector<std::string>& words) {
    return std::any_of(words.begin(), words.end(),
                       [&](const std::string& w) { return utils::containsWholeWord(lowered, w); });
}

void appendUnique(std::vector<std::string>& list, const std::string& value) {
    std::string key = utils::toLower(value);
    bool present = std::any_of(list.begin(), list.end(),
                               [&](const std::string& v) { return utils::toLower(v) == key; });
    if (!present && !value.empty()) {
        list.push_back(value);
    }
}

std::string ensureSentence(const std::string& text) {
    std::string trimmed = utils::trim(text);
    if (trimmed.empty()) {
        return trimmed;
    }
    char last = trimmed.back();
    if (last != '.' && last != '!' && last != '?') {
        trimmed += '.';
    }
    return utils::capitalizeFirst(trimmed);
}

double baseScore(const std::string& likelihood) {
    if (likelihood == "High") return 0.6;
    if (likelihood == "Medium") return 0.4;
    return 0.2;
}

} // namespace

SectionBuilder::SectionBuilder(VocabularyStorePtr vocabulary, size_t max_hpi_sentences)
    : vocabulary_(std::move(vocabulary)), max_hpi_sentences_(max_hpi_sentences) {
    if (!vocabulary_) {
        throw std::invalid_argument("SectionBuilder requires a vocabulary");
    }
}

const ClinicalEntity* SectionBuilder::selectChiefComplaint(const std::vector<ClinicalEntity>& entities) const {
    const ClinicalEntity* fallback = nullptr;
    for (const auto& entity : entities) {
        if (entity.kind != EntityKind::SYMPTOM || entity.is_negated) {
            continue;
        }
        if (entity.status == EntityStatus::ACTIVE && vocabulary_->findComplaintProfile(entity.name)) {
            return &entity;
        }
        if (!fallback) {
            fallback = &entity;
        }
    }
    return fallback;
}

std::vector<std::string> SectionBuilder::pertinentNegatives(const std::string& complaint,
                                                            const std::vector<ClinicalEntity>& entities) const {
    std::vector<std::string> negatives;
    for (const auto& entity : entities) {
        if (entity.kind == EntityKind::SYMPTOM && entity.is_negated && entity.name != complaint) {
            appendUnique(negatives, entity.name);
        }
    }

    const ComplaintProfile* profile = vocabulary_->findComplaintProfile(complaint);
    if (!profile) {
        return negatives;
    }
    for (const auto& finding : profile->expected_findings) {
        bool confirmed = std::any_of(entities.begin(), entities.end(), [&](const ClinicalEntity& e) {
            return e.kind == EntityKind::SYMPTOM && !e.is_negated && e.name == finding;
        });
        if (!confirmed) {
            appendUnique(negatives, finding);
        }
    }
    return negatives;
}

bool SectionBuilder::isSevere(const ClinicalEntity& entity) {
    if (!entity.severity) {
        return false;
    }
    const std::string& severity = *entity.severity;
    if (severity.find("severe") != std::string::npos || severity.find("worst") != std::string::npos ||
        severity.find("excruciating") != std::string::npos || severity.find("terrible") != std::string::npos) {
        return true;
    }
    size_t slash = severity.find("/10");
    if (slash != std::string::npos) {
        size_t start = slash;
        while (start > 0 && std::isdigit(static_cast<unsigned char>(severity[start - 1]))) {
            start--;
        }
        int score = utils::parseNumberWord(severity.substr(start, slash - start));
        return score >= 7;
    }
    return false;
}

RiskLevel SectionBuilder::assessRiskLevel(const ClinicalEntity* complaint,
                                          const std::vector<ClinicalEntity>& entities) const {
    bool any_risk = false;
    for (const auto& entity : entities) {
        if (entity.kind != EntityKind::RISK_FACTOR) {
            continue;
        }
        if (entity.severity && *entity.severity == "high") {
            return RiskLevel::HIGH;
        }
        any_risk = true;
    }
    if (any_risk) {
        return RiskLevel::MODERATE;
    }
    if (complaint && isSevere(*complaint) &&
        std::find(kHighAcuitySystems.begin(), kHighAcuitySystems.end(), complaint->category) !=
            kHighAcuitySystems.end()) {
        return RiskLevel::MODERATE;
    }
    return RiskLevel::LOW;
}

std::vector<Differential> SectionBuilder::rankDifferentials(const ClinicalEntity* complaint,
                                                            const std::vector<ClinicalEntity>& entities,
                                                            const std::vector<RiskRule>& fired) const {
    std::vector<Differential> ranked;
    if (!complaint) {
        return ranked;
    }
    const ComplaintProfile* profile = vocabulary_->findComplaintProfile(complaint->name);
    if (!profile) {
        return ranked;
    }

    std::vector<std::string> findings;
    for (const auto& entity : entities) {
        if (!entity.is_negated && (entity.kind == EntityKind::SYMPTOM || entity.kind == EntityKind::CONDITION)) {
            findings.push_back(entity.name);
        }
    }
    for (const auto& attribute : {complaint->quality, complaint->location, complaint->radiation, complaint->severity}) {
        if (attribute) {
            findings.push_back(*attribute);
        }
    }

    for (const auto& templ : profile->differentials) {
        Differential differential;
        differential.diagnosis = templ.diagnosis;
        differential.icd10 = templ.icd10;
        differential.likelihood = templ.likelihood;
        differential.workup = templ.workup;
        differential.score = baseScore(templ.likelihood);

        for (const auto& feature : templ.supporting) {
            bool present = std::any_of(findings.begin(), findings.end(), [&](const std::string& f) {
                return f == feature || utils::containsWholeWord(f, feature);
            });
            if (present) {
                appendUnique(differential.supporting, feature);
            }
        }
        differential.score += 0.1 * static_cast<double>(differential.supporting.size());

        for (const auto& rule : fired) {
            if (rule.promotes == templ.diagnosis) {
                differential.score += 0.5;
                differential.likelihood = "High";
                appendUnique(differential.supporting, rule.output_name);
            }
        }
        ranked.push_back(differential);
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Differential& a, const Differential& b) { return a.score > b.score; });
    return ranked;
}

std::vector<std::string> SectionBuilder::hpiElements(const ClinicalEntity* complaint,
                                                     const std::vector<ClinicalEntity>& entities,
                                                     const std::string& transcript) {
    std::string lowered = utils::toLower(transcript);
    bool has_timing = std::any_of(entities.begin(), entities.end(), [](const ClinicalEntity& e) {
        return e.kind == EntityKind::TIMING_MARKER;
    });

    std::vector<std::string> elements;
    if ((complaint && complaint->duration) || containsAnyWord(lowered, kOnsetWords)) {
        elements.push_back("O");
    }
    if (complaint && complaint->location) {
        elements.push_back("L");
    }
    if (has_timing) {
        elements.push_back("D");
    }
    if (complaint && complaint->quality) {
        elements.push_back("C");
    }
    if (containsAnyWord(lowered, kModifyingWords)) {
        elements.push_back("A");
    }
    if (complaint && complaint->radiation) {
        elements.push_back("R");
    }
    if (containsAnyWord(lowered, kTimingWords)) {
        elements.push_back("T");
    }
    if (complaint && complaint->severity) {
        elements.push_back("S");
    }
    return elements;
}

std::string SectionBuilder::describeMedication(const ClinicalEntity& medication) {
    std::string text = utils::capitalizeFirst(medication.name);
    for (const auto& part : {medication.dose, medication.route, medication.frequency}) {
        if (part) {
            text += " " + *part;
        }
    }
    if (medication.status == EntityStatus::DISCONTINUED) {
        text += medication.duration ? " (discontinued " + *medication.duration + ")" : " (discontinued)";
    }
    return text;
}

std::string SectionBuilder::buildHpi(const ClinicalEntity* complaint, const ClinicalAssessment& assessment,
                                     const std::vector<ClinicalEntity>& entities,
                                     const std::vector<FusedSentence>& sentences) const {
    std::vector<std::string> parts;

    if (complaint) {
        std::string opening = "Patient presents with " + complaint->name;
        if (assessment.risk_level == RiskLevel::HIGH) {
            opening += " with high-risk features (" + utils::join(assessment.risk_factors, "; ") + ").";
        } else if (!assessment.risk_factors.empty()) {
            opening += "; relevant risk factors include " + utils::join(assessment.risk_factors, "; ") + ".";
        } else {
            opening += ".";
        }
        parts.push_back(opening);

        std::vector<std::string> clauses;
        if (complaint->duration) clauses.push_back("began " + *complaint->duration);
        if (complaint->quality) clauses.push_back("is described as " + *complaint->quality);
        if (complaint->location) clauses.push_back("is located in the " + *complaint->location);
        if (complaint->radiation) clauses.push_back("radiates to the " + *complaint->radiation);
        if (complaint->severity) clauses.push_back("is rated " + *complaint->severity);
        if (complaint->status == EntityStatus::RESOLVED) clauses.push_back("has since resolved");
        if (!clauses.empty()) {
            parts.push_back("The " + complaint->name + " " + utils::joinNatural(clauses) + ".");
        }
    } else if (!sentences.empty()) {
        parts.push_back("Patient presents for evaluation.");
    }

    if (!assessment.associated_symptoms.empty()) {
        parts.push_back("Associated symptoms include " + utils::joinNatural(assessment.associated_symptoms) + ".");
    }

    if (!assessment.past_history.empty()) {
        std::vector<std::string> history;
        for (const auto& item : assessment.past_history) {
            history.push_back(utils::toLower(item));
        }
        parts.push_back("Relevant history includes " + utils::joinNatural(history) + ".");
    }
    for (const auto& entity : entities) {
        if (entity.kind == EntityKind::MEDICATION && !entity.is_negated &&
            entity.status == EntityStatus::DISCONTINUED) {
            std::string line = utils::capitalizeFirst(entity.name) + " was discontinued";
            if (entity.duration) {
                line += " " + *entity.duration;
            }
            parts.push_back(line + ".");
        }
    }

    // Highest scoring sentences, rendered in transcript order
    std::vector<FusedSentence> narrative;
    for (const auto& sentence : sentences) {
        if (sentence.score > 0.0) {
            narrative.push_back(sentence);
        }
    }
    std::stable_sort(narrative.begin(), narrative.end(),
                     [](const FusedSentence& a, const FusedSentence& b) { return a.score > b.score; });
    if (narrative.size() > max_hpi_sentences_) {
        narrative.resize(max_hpi_sentences_);
    }
    std::stable_sort(narrative.begin(), narrative.end(),
                     [](const FusedSentence& a, const FusedSentence& b) { return a.order < b.order; });
    for (const auto& sentence : narrative) {
        parts.push_back(ensureSentence(sentence.content));
    }

    if (!assessment.pertinent_negatives.empty()) {
        parts.push_back("Denies " + utils::joinNatural(assessment.pertinent_negatives) + ".");
    }
    return utils::join(parts, " ");
}

void SectionBuilder::buildReviewOfSystems(ClinicalAssessment& assessment,
                                          const std::vector<ClinicalEntity>& entities) const {
    for (const auto& entity : entities) {
        if (entity.kind != EntityKind::SYMPTOM || entity.category.empty()) {
            continue;
        }
        std::string finding;
        if (entity.is_negated) {
            finding = "Negative for " + entity.name;
        } else if (entity.status == EntityStatus::RESOLVED) {
            finding = "Positive for " + entity.name + " (resolved)";
        } else {
            finding = "Positive for " + entity.name;
        }
        appendUnique(assessment.ros[entity.category], finding);
    }

    for (const auto& negative : assessment.pertinent_negatives) {
        const VocabularyTerm* term = vocabulary_->findCanonical(EntityKind::SYMPTOM, negative);
        if (!term || term->category.empty()) {
            continue;
        }
        auto& findings = assessment.ros[term->category];
        bool positive = std::any_of(findings.begin(), findings.end(), [&](const std::string& f) {
            return f.rfind("Positive for " + negative, 0) == 0;
        });
        if (!positive) {
            appendUnique(findings, "Negative for " + negative);
        }
    }
}

void SectionBuilder::buildPhysicalExam(ClinicalAssessment& assessment, const std::string& transcript) const {
    for (const auto& sentence : utils::splitSentences(transcript)) {
        std::string lowered = utils::toLower(sentence);
        for (const auto& entry : vocabulary_->examTable()) {
            if (utils::containsWholeWord(lowered, entry.first)) {
                std::string& area = assessment.physical_exam[entry.second];
                std::string finding = ensureSentence(sentence);
                if (area.find(finding) == std::string::npos) {
                    area += area.empty() ? finding : " " + finding;
                }
                break;
            }
        }
    }
}

void SectionBuilder::buildHistory(ClinicalAssessment& assessment, const std::vector<ClinicalEntity>& entities,
                                  const std::string& transcript) const {
    static const std::regex relative_regex(
        "\\b(mother|father|brother|sister|mom|dad|parents)\\s+(?:had|has|have|died of)\\b");
    static const std::regex family_regex("\\bfamily history of\\b");
    static const std::regex allergy_regex("\\ballerg(?:ic|y|ies) to ([a-z]+)");
    static const std::regex nkda_regex("\\bno (?:known )?(?:drug )?allergies\\b");

    std::string lowered = utils::toLower(transcript);

    // Family history clauses run to the next clause punctuation
    std::vector<std::pair<size_t, size_t>> family_spans;
    auto clauseEnd = [&](size_t from) {
        size_t end = lowered.find_first_of(".,;!?\n", from);
        return end == std::string::npos ? lowered.size() : end;
    };
    auto collectFamily = [&](size_t begin, size_t end, const std::string& relative) {
        family_spans.emplace_back(begin, end);
        std::string clause = lowered.substr(begin, end - begin);
        for (const auto& term : vocabulary_->getTerms()) {
            if (term.kind != EntityKind::CONDITION && term.kind != EntityKind::SYMPTOM) {
                continue;
            }
            if (utils::containsWholeWord(clause, term.phrase)) {
                std::string entry = relative.empty() ? utils::capitalizeFirst(term.canonical)
                                                     : utils::capitalizeFirst(relative) + ": " + term.canonical;
                appendUnique(assessment.family_history, entry);
            }
        }
    };
    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), relative_regex);
         it != std::sregex_iterator(); ++it) {
        size_t begin = static_cast<size_t>(it->position(0));
        collectFamily(begin, clauseEnd(begin + static_cast<size_t>(it->length(0))), it->str(1));
    }
    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), family_regex);
         it != std::sregex_iterator(); ++it) {
        size_t begin = static_cast<size_t>(it->position(0));
        collectFamily(begin, clauseEnd(begin + static_cast<size_t>(it->length(0))), "");
    }
    auto inFamilyClause = [&](size_t offset) {
        return std::any_of(family_spans.begin(), family_spans.end(), [&](const std::pair<size_t, size_t>& s) {
            return offset >= s.first && offset < s.second;
        });
    };

    for (const auto& entity : entities) {
        switch (entity.kind) {
            case EntityKind::MEDICATION:
                if (!entity.is_negated) {
                    appendUnique(assessment.medications, describeMedication(entity));
                }
                break;
            case EntityKind::CONDITION:
                if (entity.category == "tobacco_use" || entity.category == "alcohol_use") {
                    appendUnique(assessment.social_history,
                                 entity.is_negated ? "Denies " + entity.name : utils::capitalizeFirst(entity.name));
                } else if (!entity.is_negated && !inFamilyClause(entity.offset)) {
                    std::string item = utils::capitalizeFirst(entity.name);
                    if (entity.duration) {
                        item += " (" + *entity.duration + ")";
                    }
                    appendUnique(assessment.past_history, item);
                }
                break;
            case EntityKind::PROCEDURE:
                appendUnique(assessment.procedures, entity.is_negated ? entity.name + " (negative)" : entity.name);
                break;
            case EntityKind::RISK_FACTOR:
                appendUnique(assessment.risk_factors, entity.name);
                break;
            default:
                break;
        }
    }

    if (std::regex_search(lowered, nkda_regex)) {
        appendUnique(assessment.allergies, "NKDA");
    }
    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), allergy_regex);
         it != std::sregex_iterator(); ++it) {
        appendUnique(assessment.allergies, utils::capitalizeFirst(it->str(1)));
    }
}

std::string SectionBuilder::findDisposition(const std::string& transcript) const {
    std::string lowered = utils::toLower(transcript);
    for (const auto& entry : vocabulary_->dispositionTable()) {
        if (utils::containsWholeWord(lowered, entry.first) && !negation_.isNegated(lowered, entry.first)) {
            return entry.second;
        }
    }
    return "";
}

void SectionBuilder::buildClosing(ClinicalAssessment& assessment, const std::string& transcript) const {
    static const std::regex follow_regex(
        "\\bfollow(?:\\s|-)?up with (?:your |a |the )?([a-z ]+?) in ([a-z0-9]+ (?:days?|weeks?))");

    std::string lowered = utils::toLower(transcript);
    assessment.disposition = findDisposition(transcript);

    if (!assessment.chief_complaint.empty()) {
        std::string impression = utils::capitalizeFirst(assessment.chief_complaint);
        if (!assessment.differentials.empty()) {
            impression += ", " + assessment.differentials.front().diagnosis + " under consideration";
        }
        assessment.final_impression = impression;
    }

    bool discharged = assessment.disposition == "Discharge home";
    if (discharged) {
        std::vector<std::string> instructions;
        if (const ComplaintProfile* profile = vocabulary_->findComplaintProfile(assessment.chief_complaint)) {
            if (!profile->discharge_instructions.empty()) {
                instructions.push_back(profile->discharge_instructions);
            }
        }
        instructions.push_back("Take medications as prescribed and return for any new or worsening symptoms.");
        assessment.discharge_instructions = utils::join(instructions, " ");
    }

    std::smatch m;
    if (std::regex_search(lowered, m, follow_regex)) {
        assessment.follow_up = "Follow up with " + m.str(1) + " in " + m.str(2) + ".";
    } else if (discharged) {
        assessment.follow_up = "Follow up with primary care within 2-3 days.";
    }

    if (utils::containsWholeWord(lowered, "improved") || utils::containsWholeWord(lowered, "feeling better")) {
        assessment.condition = "Improved";
    } else if (utils::containsWholeWord(lowered, "stable")) {
        assessment.condition = "Stable";
    }
}

std::string SectionBuilder::buildMdm(const ClinicalEntity* complaint, const ClinicalAssessment& assessment) const {
    std::vector<std::string> parts;
    if (complaint) {
        std::string category = complaint->category.empty() ? "" : " (" + utils::toLower(complaint->category) + ")";
        parts.push_back("Presentation of " + complaint->name + category + " assessed as " +
                        riskLevelToString(assessment.risk_level) + " risk.");
        if (const ComplaintProfile* profile = vocabulary_->findComplaintProfile(complaint->name)) {
            if (!profile->mdm_focus.empty()) {
                parts.push_back(profile->mdm_focus);
            }
        }
    } else {
        parts.push_back("Insufficient history to establish a working diagnosis.");
    }

    if (assessment.risk_level == RiskLevel::HIGH) {
        parts.push_back("High-risk features identified: " + utils::join(assessment.risk_factors, "; ") +
                        ". Emergent evaluation is warranted.");
    } else if (!assessment.risk_factors.empty()) {
        parts.push_back("Risk factors considered: " + utils::join(assessment.risk_factors, "; ") + ".");
    }

    if (!assessment.differentials.empty()) {
        std::vector<std::string> names;
        for (size_t i = 0; i < assessment.differentials.size() && i < kMdmDifferentials; ++i) {
            names.push_back(assessment.differentials[i].diagnosis);
        }
        parts.push_back("Differential diagnosis includes " + utils::joinNatural(names) + ".");
    }
    if (!assessment.procedures.empty()) {
        parts.push_back("Workup discussed: " + utils::join(assessment.procedures, ", ") + ".");
    }
    return utils::join(parts, " ");
}

std::vector<std::string> SectionBuilder::buildPlan(const ClinicalAssessment& assessment,
                                                   const std::vector<RiskRule>& fired) const {
    std::vector<std::string> plan;
    for (const auto& rule : fired) {
        if (!rule.plan_item.empty()) {
            appendUnique(plan, rule.plan_item);
        }
    }
    for (const auto& procedure : assessment.procedures) {
        if (procedure.find("(negative)") == std::string::npos) {
            appendUnique(plan, "Obtain " + procedure);
        }
    }
    for (size_t i = 0; i < assessment.differentials.size() && i < 2; ++i) {
        for (const auto& item : assessment.differentials[i].workup) {
            if (plan.size() >= kMaxPlanItems) {
                return plan;
            }
            appendUnique(plan, item);
        }
    }
    return plan;
}

ClinicalAssessment SectionBuilder::build(const std::vector<ClinicalEntity>& entities,
                                         const std::vector<FusedSentence>& sentences,
                                         const std::string& transcript) const {
    ClinicalAssessment assessment;
    const ClinicalEntity* complaint = selectChiefComplaint(entities);
    if (complaint) {
        assessment.chief_complaint = complaint->name;
        assessment.complaint_category = complaint->category;
    }

    for (const auto& entity : entities) {
        if (entity.kind == EntityKind::SYMPTOM && !entity.is_negated && &entity != complaint) {
            appendUnique(assessment.associated_symptoms, entity.name);
        }
    }
    assessment.pertinent_negatives = pertinentNegatives(assessment.chief_complaint, entities);

    buildHistory(assessment, entities, transcript);
    assessment.risk_level = assessRiskLevel(complaint, entities);

    std::vector<RiskRule> fired;
    for (const auto& rule : vocabulary_->getRiskRules()) {
        if (std::find(assessment.risk_factors.begin(), assessment.risk_factors.end(), rule.output_name) !=
            assessment.risk_factors.end()) {
            fired.push_back(rule);
        }
    }

    assessment.hpi_elements = hpiElements(complaint, entities, transcript);
    assessment.hpi = buildHpi(complaint, assessment, entities, sentences);
    buildReviewOfSystems(assessment, entities);
    buildPhysicalExam(assessment, transcript);

    assessment.differentials = rankDifferentials(complaint, entities, fired);
    assessment.mdm = buildMdm(complaint, assessment);
    assessment.plan = buildPlan(assessment, fired);
    buildClosing(assessment, transcript);

    utils::Logger::debug("Assessment built: complaint='" + assessment.chief_complaint + "', risk=" +
                         riskLevelToString(assessment.risk_level) + ", differentials=" +
                         std::to_string(assessment.differentials.size()));
    return assessment;
}

} // namespace clinical
} // namespace clinscribe
