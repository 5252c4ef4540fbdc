#include "clinical/note_renderer.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <cctype>
#include <sstream>

namespace clinscribe {
namespace clinical {

namespace {

std::string bullets(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += "\n";
        }
        out += "- " + item;
    }
    return out;
}

std::string rosLines(const ClinicalAssessment& a) {
    std::string out;
    for (const auto& system : a.ros) {
        if (system.second.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += "\n";
        }
        out += system.first + ": " + utils::join(system.second, "; ") + ".";
    }
    return out;
}

std::string examLines(const ClinicalAssessment& a) {
    std::string out;
    for (const auto& area : a.physical_exam) {
        if (!out.empty()) {
            out += "\n";
        }
        out += area.first + ": " + area.second;
    }
    return out;
}

std::string differentialLines(const ClinicalAssessment& a) {
    std::string out;
    for (size_t i = 0; i < a.differentials.size(); ++i) {
        const auto& d = a.differentials[i];
        if (!out.empty()) {
            out += "\n";
        }
        out += std::to_string(i + 1) + ". " + d.diagnosis;
        if (!d.icd10.empty()) {
            out += " (" + d.icd10 + ")";
        }
        out += " - " + d.likelihood + " likelihood";
    }
    return out;
}

std::string assessmentText(const ClinicalAssessment& a) {
    std::vector<std::string> parts;
    if (!a.final_impression.empty()) {
        parts.push_back(a.final_impression);
    }
    if (!a.risk_factors.empty()) {
        parts.push_back("Risk factors: " + utils::join(a.risk_factors, "; "));
    }
    std::string ddx = differentialLines(a);
    if (!ddx.empty()) {
        parts.push_back("Differential diagnosis:\n" + ddx);
    }
    return utils::join(parts, "\n");
}

std::string labelled(const std::string& label, const std::string& content) {
    return content.empty() ? "" : label + ": " + content;
}

std::string joinNonEmpty(const std::vector<std::string>& parts, const std::string& separator) {
    std::vector<std::string> kept;
    for (const auto& part : parts) {
        if (!part.empty()) {
            kept.push_back(part);
        }
    }
    return utils::join(kept, separator);
}

std::vector<std::string> activeMedications(const ClinicalAssessment& a) {
    std::vector<std::string> active;
    for (const auto& med : a.medications) {
        if (med.find("(discontinued") == std::string::npos) {
            active.push_back(med);
        }
    }
    return active;
}

const std::vector<SectionSpec> kSoapSections = {
    {"subjective", "Subjective", true, SectionPhase::ANY},
    {"objective", "Objective", true, SectionPhase::ANY},
    {"assessment", "Assessment", true, SectionPhase::ANY},
    {"plan", "Plan", true, SectionPhase::ANY},
};

const std::vector<SectionSpec> kEdSections = {
    {"chief_complaint", "Chief Complaint", true, SectionPhase::INITIAL},
    {"hpi", "History of Present Illness", true, SectionPhase::INITIAL},
    {"past_medical_history", "Past Medical History", false, SectionPhase::INITIAL},
    {"medications", "Medications", false, SectionPhase::INITIAL},
    {"allergies", "Allergies", false, SectionPhase::INITIAL},
    {"family_history", "Family History", false, SectionPhase::INITIAL},
    {"social_history", "Social History", false, SectionPhase::INITIAL},
    {"ros", "Review of Systems", true, SectionPhase::INITIAL},
    {"physical_exam", "Physical Exam", true, SectionPhase::INITIAL},
    {"results", "Results", false, SectionPhase::FOLLOW_UP},
    {"mdm", "Medical Decision Making", true, SectionPhase::FOLLOW_UP},
    {"differential", "Differential Diagnosis", false, SectionPhase::FOLLOW_UP},
    {"final_impression", "Final Impression", true, SectionPhase::FOLLOW_UP},
    {"disposition", "Disposition", true, SectionPhase::FOLLOW_UP},
    {"discharge_instructions", "Discharge Instructions", false, SectionPhase::FOLLOW_UP},
    {"follow_up", "Follow-up", false, SectionPhase::FOLLOW_UP},
};

const std::vector<SectionSpec> kProgressSections = {
    {"interval_history", "Interval History", true, SectionPhase::ANY},
    {"current_status", "Current Status", true, SectionPhase::ANY},
    {"physical_exam", "Physical Exam", true, SectionPhase::ANY},
    {"results", "Results", false, SectionPhase::ANY},
    {"assessment_plan", "Assessment and Plan", true, SectionPhase::ANY},
};

const std::vector<SectionSpec> kConsultSections = {
    {"reason_for_consult", "Reason for Consultation", true, SectionPhase::ANY},
    {"hpi", "History of Present Illness", true, SectionPhase::ANY},
    {"past_medical_history", "Past Medical History", false, SectionPhase::ANY},
    {"medications", "Medications", false, SectionPhase::ANY},
    {"allergies", "Allergies", false, SectionPhase::ANY},
    {"physical_exam", "Physical Exam", true, SectionPhase::ANY},
    {"assessment", "Assessment", true, SectionPhase::ANY},
    {"recommendations", "Recommendations", true, SectionPhase::ANY},
};

const std::vector<SectionSpec> kHandoffSections = {
    {"situation", "Situation", true, SectionPhase::ANY},
    {"background", "Background", true, SectionPhase::ANY},
    {"sbar_assessment", "Assessment", true, SectionPhase::ANY},
    {"recommendation", "Recommendation", true, SectionPhase::ANY},
};

const std::vector<SectionSpec> kDischargeSections = {
    {"admission_diagnosis", "Admission Diagnosis", true, SectionPhase::ANY},
    {"discharge_diagnosis", "Discharge Diagnosis", true, SectionPhase::ANY},
    {"hospital_course", "Hospital Course", true, SectionPhase::ANY},
    {"discharge_medications", "Discharge Medications", true, SectionPhase::ANY},
    {"discharge_instructions", "Discharge Instructions", true, SectionPhase::ANY},
    {"condition_at_discharge", "Condition at Discharge", true, SectionPhase::ANY},
    {"follow_up", "Follow-up", false, SectionPhase::ANY},
};

} // namespace

NoteRenderer::NoteRenderer(const std::string& placeholder)
    : placeholder_(placeholder) {
    builders_["chief_complaint"] = [](const ClinicalAssessment& a) { return utils::capitalizeFirst(a.chief_complaint); };
    builders_["hpi"] = [](const ClinicalAssessment& a) { return a.hpi; };
    builders_["interval_history"] = [](const ClinicalAssessment& a) { return a.hpi; };
    builders_["past_medical_history"] = [](const ClinicalAssessment& a) { return bullets(a.past_history); };
    builders_["medications"] = [](const ClinicalAssessment& a) { return bullets(a.medications); };
    builders_["allergies"] = [](const ClinicalAssessment& a) { return utils::join(a.allergies, ", "); };
    builders_["family_history"] = [](const ClinicalAssessment& a) { return bullets(a.family_history); };
    builders_["social_history"] = [](const ClinicalAssessment& a) { return bullets(a.social_history); };
    builders_["ros"] = rosLines;
    builders_["current_status"] = rosLines;
    builders_["physical_exam"] = examLines;
    builders_["results"] = [](const ClinicalAssessment& a) { return bullets(a.procedures); };
    builders_["mdm"] = [](const ClinicalAssessment& a) { return a.mdm; };
    builders_["differential"] = differentialLines;
    builders_["final_impression"] = [](const ClinicalAssessment& a) { return a.final_impression; };
    builders_["discharge_diagnosis"] = [](const ClinicalAssessment& a) { return a.final_impression; };
    builders_["disposition"] = [](const ClinicalAssessment& a) { return a.disposition; };
    builders_["discharge_instructions"] = [](const ClinicalAssessment& a) { return a.discharge_instructions; };
    builders_["follow_up"] = [](const ClinicalAssessment& a) { return a.follow_up; };
    builders_["plan"] = [](const ClinicalAssessment& a) { return bullets(a.plan); };
    builders_["recommendations"] = [](const ClinicalAssessment& a) { return bullets(a.plan); };
    builders_["assessment"] = assessmentText;
    builders_["sbar_assessment"] = assessmentText;
    builders_["admission_diagnosis"] = [](const ClinicalAssessment& a) { return utils::capitalizeFirst(a.chief_complaint); };
    builders_["condition_at_discharge"] = [](const ClinicalAssessment& a) { return a.condition; };
    builders_["discharge_medications"] = [](const ClinicalAssessment& a) { return bullets(activeMedications(a)); };

    builders_["subjective"] = [](const ClinicalAssessment& a) {
        return joinNonEmpty({labelled("Chief Complaint", utils::capitalizeFirst(a.chief_complaint)),
                             a.hpi,
                             labelled("Medications", utils::join(a.medications, ", ")),
                             labelled("Allergies", utils::join(a.allergies, ", "))},
                            "\n");
    };
    builders_["objective"] = [](const ClinicalAssessment& a) {
        return joinNonEmpty({examLines(a), labelled("Results", utils::join(a.procedures, ", "))}, "\n");
    };
    builders_["assessment_plan"] = [](const ClinicalAssessment& a) {
        std::string plan = bullets(a.plan);
        return joinNonEmpty({assessmentText(a), plan.empty() ? "" : "Plan:\n" + plan}, "\n");
    };
    builders_["reason_for_consult"] = [](const ClinicalAssessment& a) {
        if (a.chief_complaint.empty()) {
            return std::string();
        }
        std::string reason = utils::capitalizeFirst(a.chief_complaint);
        if (!a.risk_factors.empty()) {
            reason += "; " + utils::join(a.risk_factors, "; ");
        }
        return reason;
    };
    builders_["situation"] = [](const ClinicalAssessment& a) {
        if (a.chief_complaint.empty()) {
            return std::string();
        }
        return "Patient with " + a.chief_complaint + ", " + riskLevelToString(a.risk_level) + " risk.";
    };
    builders_["background"] = [](const ClinicalAssessment& a) {
        return joinNonEmpty({labelled("History", utils::join(a.past_history, ", ")),
                             labelled("Medications", utils::join(a.medications, ", ")),
                             labelled("Allergies", utils::join(a.allergies, ", "))},
                            "\n");
    };
    builders_["recommendation"] = [](const ClinicalAssessment& a) {
        return joinNonEmpty({bullets(a.plan), labelled("Disposition", a.disposition)}, "\n");
    };
    builders_["hospital_course"] = [](const ClinicalAssessment& a) {
        return joinNonEmpty({a.hpi, labelled("Workup", utils::join(a.procedures, ", "))}, "\n");
    };
}

const std::vector<SectionSpec>& NoteRenderer::sectionSpecs(NoteType type) {
    switch (type) {
        case NoteType::SOAP: return kSoapSections;
        case NoteType::ED_NOTE: return kEdSections;
        case NoteType::PROGRESS: return kProgressSections;
        case NoteType::CONSULT: return kConsultSections;
        case NoteType::HANDOFF: return kHandoffSections;
        case NoteType::DISCHARGE: return kDischargeSections;
    }
    return kSoapSections;
}

std::string NoteRenderer::noteTitle(NoteType type) {
    switch (type) {
        case NoteType::SOAP: return "SOAP NOTE";
        case NoteType::ED_NOTE: return "EMERGENCY DEPARTMENT NOTE";
        case NoteType::PROGRESS: return "PROGRESS NOTE";
        case NoteType::CONSULT: return "CONSULTATION NOTE";
        case NoteType::HANDOFF: return "HANDOFF (SBAR)";
        case NoteType::DISCHARGE: return "DISCHARGE SUMMARY";
    }
    return "CLINICAL NOTE";
}

bool NoteRenderer::isVisible(const SectionSpec& spec, EncounterPhase phase) {
    if (spec.phase == SectionPhase::ANY || phase == EncounterPhase::FOLLOW_UP) {
        return true;
    }
    return spec.phase == SectionPhase::INITIAL;
}

std::string NoteRenderer::sectionContent(const std::string& key, const ClinicalAssessment& assessment) const {
    auto it = builders_.find(key);
    if (it == builders_.end()) {
        utils::Logger::warn("No content builder for section '" + key + "'");
        return "";
    }
    return utils::trim(it->second(assessment));
}

ValidatedSections NoteRenderer::validate(const NoteRequest& request, const ClinicalAssessment& assessment) const {
    ValidatedSections result;
    std::string type_name = noteTypeToString(request.note_type);

    for (const auto& spec : sectionSpecs(request.note_type)) {
        std::string content = sectionContent(spec.key, assessment);
        bool visible = isVisible(spec, request.phase);

        if (spec.required && visible) {
            result.required_count++;
            if (!content.empty()) {
                result.filled_count++;
            }
        }
        if (content.empty()) {
            if (!spec.required) {
                continue;
            }
            content = placeholder_;
            if (visible) {
                result.warnings.push_back(
                    utils::makeMissingRequiredSectionWarning(type_name, spec.key, request.encounter_id));
            }
        }
        result.sections[spec.key] = content;
    }
    return result;
}

std::string NoteRenderer::render(const NoteRequest& request, const ValidatedSections& validated) const {
    std::ostringstream out;
    out << noteTitle(request.note_type) << "\n";
    if (!request.encounter_id.empty()) {
        out << "Encounter: " << request.encounter_id << "\n";
    }
    if (request.note_type == NoteType::ED_NOTE) {
        out << "Phase: " << encounterPhaseToString(request.phase) << "\n";
    }

    for (const auto& spec : sectionSpecs(request.note_type)) {
        if (!isVisible(spec, request.phase)) {
            continue;
        }
        auto it = validated.sections.find(spec.key);
        if (it == validated.sections.end()) {
            continue;
        }
        std::string heading = spec.heading;
        for (auto& c : heading) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        out << "\n" << heading << ":\n" << it->second << "\n";
    }
    return out.str();
}

std::string NoteRenderer::renderJson(const NoteRequest& request, const ClinicalAssessment& assessment) const {
    utils::JsonValue root = utils::JsonValue::makeObject();
    root.setObjectProperty("EncounterID", utils::JsonValue(request.encounter_id));
    root.setObjectProperty("Phase", utils::JsonValue(encounterPhaseToString(request.phase)));

    if (request.phase == EncounterPhase::INITIAL) {
        if (!assessment.chief_complaint.empty()) {
            root.setObjectProperty("ChiefComplaint", utils::JsonValue(utils::capitalizeFirst(assessment.chief_complaint)));
        }
        if (!assessment.hpi.empty()) {
            root.setObjectProperty("HPI", utils::JsonValue(assessment.hpi));
        }
        utils::JsonValue ros = utils::JsonValue::makeObject();
        for (const auto& system : assessment.ros) {
            if (!system.second.empty()) {
                ros.setObjectProperty(system.first, utils::JsonValue(utils::join(system.second, "; ")));
            }
        }
        if (!ros.asObject().empty()) {
            root.setObjectProperty("ROS", ros);
        }
        utils::JsonValue exam = utils::JsonValue::makeObject();
        for (const auto& area : assessment.physical_exam) {
            exam.setObjectProperty(area.first, utils::JsonValue(area.second));
        }
        if (!exam.asObject().empty()) {
            root.setObjectProperty("PE", exam);
        }
    } else {
        utils::JsonValue mdm = utils::JsonValue::makeObject();
        if (!assessment.differentials.empty()) {
            utils::JsonValue ddx = utils::JsonValue::makeArray();
            for (const auto& d : assessment.differentials) {
                utils::JsonValue item = utils::JsonValue::makeObject();
                item.setObjectProperty("Diagnosis", utils::JsonValue(d.diagnosis));
                item.setObjectProperty("ICD10", utils::JsonValue(d.icd10));
                item.setObjectProperty("Likelihood", utils::JsonValue(d.likelihood));
                ddx.addArrayElement(item);
            }
            mdm.setObjectProperty("DDx", ddx);
        }
        if (!assessment.mdm.empty()) {
            mdm.setObjectProperty("ClinicalReasoning", utils::JsonValue(assessment.mdm));
        }
        if (!assessment.plan.empty()) {
            mdm.setObjectProperty("Plan", utils::JsonValue::fromStrings(assessment.plan));
        }
        if (!mdm.asObject().empty()) {
            root.setObjectProperty("MDM", mdm);
        }
        if (!assessment.final_impression.empty()) {
            root.setObjectProperty("FinalImpression", utils::JsonValue(assessment.final_impression));
        }
        if (!assessment.disposition.empty()) {
            root.setObjectProperty("Dispo", utils::JsonValue(assessment.disposition));
        }
        if (!assessment.discharge_instructions.empty()) {
            root.setObjectProperty("DischargeInstructions", utils::JsonValue(assessment.discharge_instructions));
        }
    }
    return utils::JsonParser::stringify(root, 2);
}

} // namespace clinical
} // namespace clinscribe
