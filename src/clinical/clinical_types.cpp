#include "clinical/clinical_types.hpp"
#include "utils/text_utils.hpp"

namespace clinscribe {
namespace clinical {

std::string entityKindToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::SYMPTOM: return "symptom";
        case EntityKind::MEDICATION: return "medication";
        case EntityKind::CONDITION: return "condition";
        case EntityKind::RISK_FACTOR: return "riskFactor";
        case EntityKind::TIMING_MARKER: return "timingMarker";
        case EntityKind::PROCEDURE: return "procedure";
    }
    return "symptom";
}

std::string entityStatusToString(EntityStatus status) {
    switch (status) {
        case EntityStatus::ACTIVE: return "active";
        case EntityStatus::RESOLVED: return "resolved";
        case EntityStatus::DISCONTINUED: return "discontinued";
    }
    return "active";
}

std::string riskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "low";
        case RiskLevel::MODERATE: return "moderate";
        case RiskLevel::HIGH: return "high";
    }
    return "low";
}

std::string noteTypeToString(NoteType type) {
    switch (type) {
        case NoteType::SOAP: return "SOAP";
        case NoteType::ED_NOTE: return "ED_NOTE";
        case NoteType::PROGRESS: return "PROGRESS";
        case NoteType::CONSULT: return "CONSULT";
        case NoteType::HANDOFF: return "HANDOFF";
        case NoteType::DISCHARGE: return "DISCHARGE";
    }
    return "SOAP";
}

bool parseNoteType(const std::string& name, NoteType& out) {
    std::string key = utils::toLower(utils::trim(name));
    if (key == "soap") {
        out = NoteType::SOAP;
    } else if (key == "ed_note" || key == "ed" || key == "ednote") {
        out = NoteType::ED_NOTE;
    } else if (key == "progress") {
        out = NoteType::PROGRESS;
    } else if (key == "consult") {
        out = NoteType::CONSULT;
    } else if (key == "handoff" || key == "sbar") {
        out = NoteType::HANDOFF;
    } else if (key == "discharge") {
        out = NoteType::DISCHARGE;
    } else {
        return false;
    }
    return true;
}

std::vector<NoteType> allNoteTypes() {
    return {NoteType::SOAP, NoteType::ED_NOTE, NoteType::PROGRESS,
            NoteType::CONSULT, NoteType::HANDOFF, NoteType::DISCHARGE};
}

std::string encounterPhaseToString(EncounterPhase phase) {
    return phase == EncounterPhase::FOLLOW_UP ? "FollowUp" : "Initial";
}

bool parseEncounterPhase(const std::string& name, EncounterPhase& out) {
    std::string key = utils::toLower(utils::trim(name));
    if (key == "initial") {
        out = EncounterPhase::INITIAL;
        return true;
    }
    if (key == "followup" || key == "follow_up" || key == "follow-up") {
        out = EncounterPhase::FOLLOW_UP;
        return true;
    }
    return false;
}

} // namespace clinical
} // namespace clinscribe
