#pragma once

#include "utils/error_handler.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clinscribe {
namespace clinical {

enum class EntityKind {
    SYMPTOM,
    MEDICATION,
    CONDITION,
    RISK_FACTOR,
    TIMING_MARKER,
    PROCEDURE
};

enum class EntityStatus {
    ACTIVE,
    RESOLVED,
    DISCONTINUED
};

std::string entityKindToString(EntityKind kind);
std::string entityStatusToString(EntityStatus status);

/**
 * A typed clinical fact found in transcript text. `category` holds the
 * kind-specific class: ROS system for symptoms, drug class for medications,
 * condition type for conditions, workup group for procedures and the risk
 * category for derived risk factors.
 */
struct ClinicalEntity {
    EntityKind kind;
    std::string name;
    std::string matched_text;
    std::string category;

    std::optional<std::string> severity;
    std::optional<std::string> duration;
    std::optional<std::string> location;
    std::optional<std::string> quality;
    std::optional<std::string> radiation;

    // Medications only
    std::optional<std::string> dose;
    std::optional<std::string> route;
    std::optional<std::string> frequency;

    // Timing markers only
    std::optional<int> elapsed_days;

    bool is_negated;
    EntityStatus status;

    // Byte offset of the first mention
    size_t offset;

    ClinicalEntity()
        : kind(EntityKind::SYMPTOM), is_negated(false), status(EntityStatus::ACTIVE), offset(0) {}

    bool isPositive() const { return !is_negated; }
};

/**
 * A scored unit of clinical narrative. source_count is the number of
 * transcript sentences this one stands for and is never below 1.
 */
struct FusedSentence {
    std::string content;
    std::string topic;
    int source_count;
    double score;
    size_t order;

    FusedSentence() : source_count(1), score(0.0), order(0) {}
    FusedSentence(const std::string& c, const std::string& t, int count = 1)
        : content(c), topic(t), source_count(count < 1 ? 1 : count), score(0.0), order(0) {}
};

struct Differential {
    std::string diagnosis;
    std::string icd10;
    std::string likelihood;
    double score;
    std::vector<std::string> supporting;
    std::vector<std::string> workup;

    Differential() : score(0.0) {}
};

enum class RiskLevel {
    LOW,
    MODERATE,
    HIGH
};

std::string riskLevelToString(RiskLevel level);

/**
 * Structured content of one note-generation request. Filled by
 * SectionBuilder and read-only afterwards.
 */
struct ClinicalAssessment {
    std::string chief_complaint;
    std::string complaint_category;
    std::string hpi;
    std::vector<std::string> hpi_elements;
    std::vector<std::string> associated_symptoms;
    std::vector<std::string> pertinent_negatives;

    std::map<std::string, std::vector<std::string>> ros;
    std::map<std::string, std::string> physical_exam;

    std::vector<std::string> medications;
    std::vector<std::string> allergies;
    std::vector<std::string> past_history;
    std::vector<std::string> social_history;
    std::vector<std::string> family_history;
    std::vector<std::string> procedures;

    RiskLevel risk_level;
    std::vector<std::string> risk_factors;
    std::vector<Differential> differentials;
    std::string mdm;
    std::vector<std::string> plan;

    std::string final_impression;
    std::string disposition;
    std::string discharge_instructions;
    std::string follow_up;
    std::string condition;

    ClinicalAssessment() : risk_level(RiskLevel::LOW) {}
};

enum class NoteType {
    SOAP,
    ED_NOTE,
    PROGRESS,
    CONSULT,
    HANDOFF,
    DISCHARGE
};

enum class EncounterPhase {
    INITIAL,
    FOLLOW_UP
};

std::string noteTypeToString(NoteType type);
bool parseNoteType(const std::string& name, NoteType& out);
std::vector<NoteType> allNoteTypes();

std::string encounterPhaseToString(EncounterPhase phase);
bool parseEncounterPhase(const std::string& name, EncounterPhase& out);

struct NoteRequest {
    std::string transcript_text;
    NoteType note_type;
    std::string encounter_id;
    EncounterPhase phase;

    NoteRequest() : note_type(NoteType::SOAP), phase(EncounterPhase::INITIAL) {}
    NoteRequest(const std::string& text, NoteType type, const std::string& id,
                EncounterPhase p = EncounterPhase::INITIAL)
        : transcript_text(text), note_type(type), encounter_id(id), phase(p) {}
};

struct NoteResponse {
    std::string rendered_note;
    float quality_score;
    // Section key to content; required sections are always present
    std::map<std::string, std::string> sections;
    // ED notes only; empty otherwise
    std::string json_projection;
    std::vector<utils::ErrorInfo> warnings;

    NoteResponse() : quality_score(0.0f) {}
};

} // namespace clinical
} // namespace clinscribe
