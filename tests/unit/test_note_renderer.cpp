#include <gtest/gtest.h>
#include "clinical/note_renderer.hpp"
#include "utils/json_utils.hpp"

using namespace clinscribe;
using namespace clinscribe::clinical;

namespace {

ClinicalAssessment chestPainAssessment() {
    ClinicalAssessment a;
    a.chief_complaint = "chest pain";
    a.complaint_category = "Cardiovascular";
    a.hpi = "Patient presents with chest pain. The chest pain began this morning.";
    a.ros["Cardiovascular"] = {"Positive for chest pain", "Negative for palpitations"};
    a.ros["Respiratory"] = {"Negative for cough"};
    a.physical_exam["Respiratory"] = "Lungs are clear to auscultation.";
    a.medications = {"Metformin 500 mg BID", "Warfarin (discontinued last week)"};
    a.past_history = {"Diabetes mellitus"};
    a.procedures = {"EKG"};
    a.risk_level = RiskLevel::MODERATE;
    a.risk_factors = {"Cardiac risk: diabetes with chest pain"};
    Differential acs;
    acs.diagnosis = "Acute coronary syndrome";
    acs.icd10 = "I20.9";
    acs.likelihood = "High";
    a.differentials = {acs};
    a.mdm = "Presentation of chest pain assessed as moderate risk.";
    a.plan = {"Obtain EKG", "Troponin"};
    a.final_impression = "Chest pain, Acute coronary syndrome under consideration";
    a.disposition = "Discharge home";
    a.discharge_instructions = "Return immediately for worsening chest pain.";
    a.follow_up = "Follow up with primary care within 2-3 days.";
    a.condition = "Stable";
    return a;
}

size_t requiredSections(NoteType type, EncounterPhase phase) {
    size_t count = 0;
    for (const auto& spec : NoteRenderer::sectionSpecs(type)) {
        if (spec.required && NoteRenderer::isVisible(spec, phase)) {
            count++;
        }
    }
    return count;
}

} // namespace

class NoteRendererTest : public ::testing::Test {
protected:
    NoteRenderer renderer;
};

TEST_F(NoteRendererTest, EmptyAssessmentGetsPlaceholdersForEveryNoteType) {
    const NoteType types[] = {NoteType::SOAP, NoteType::ED_NOTE, NoteType::PROGRESS,
                              NoteType::CONSULT, NoteType::HANDOFF, NoteType::DISCHARGE};
    ClinicalAssessment empty;

    for (NoteType type : types) {
        NoteRequest request("", type, "enc-1", EncounterPhase::FOLLOW_UP);
        ValidatedSections validated = renderer.validate(request, empty);

        for (const auto& spec : NoteRenderer::sectionSpecs(type)) {
            if (spec.required) {
                ASSERT_EQ(validated.sections.count(spec.key), 1u) << noteTypeToString(type) << "." << spec.key;
                EXPECT_EQ(validated.sections[spec.key], "Not assessed.");
            } else {
                EXPECT_EQ(validated.sections.count(spec.key), 0u);
            }
        }
        EXPECT_EQ(validated.required_count, requiredSections(type, EncounterPhase::FOLLOW_UP));
        EXPECT_EQ(validated.warnings.size(), validated.required_count);
        EXPECT_EQ(validated.filled_count, 0u);
        EXPECT_DOUBLE_EQ(validated.completeness(), 0.0);
    }
}

TEST_F(NoteRendererTest, MissingSectionWarningDetails) {
    NoteRequest request("", NoteType::SOAP, "enc-9");
    ValidatedSections validated = renderer.validate(request, ClinicalAssessment());

    ASSERT_EQ(validated.warnings.size(), 4u);
    EXPECT_EQ(validated.warnings[0].category, utils::ErrorCategory::NOTE_ASSEMBLY);
    EXPECT_EQ(validated.warnings[0].severity, utils::ErrorSeverity::WARNING);
    EXPECT_EQ(validated.warnings[0].details, "SOAP.subjective");
    EXPECT_EQ(validated.warnings[0].encounter_id, "enc-9");
}

TEST_F(NoteRendererTest, InitialPhaseWarnsOnlyForVisibleSections) {
    NoteRequest request("", NoteType::ED_NOTE, "enc-2", EncounterPhase::INITIAL);
    ValidatedSections validated = renderer.validate(request, ClinicalAssessment());

    EXPECT_EQ(validated.required_count, 4u);
    EXPECT_EQ(validated.warnings.size(), 4u);
    // Follow-up sections are still placeholder-filled for later phases
    EXPECT_EQ(validated.sections["mdm"], "Not assessed.");
    EXPECT_EQ(validated.sections["disposition"], "Not assessed.");

    std::string note = renderer.render(request, validated);
    EXPECT_NE(note.find("CHIEF COMPLAINT:"), std::string::npos);
    EXPECT_EQ(note.find("MEDICAL DECISION MAKING:"), std::string::npos);
    EXPECT_EQ(note.find("DISPOSITION:"), std::string::npos);
}

TEST_F(NoteRendererTest, FilledAssessmentIsComplete) {
    ClinicalAssessment a = chestPainAssessment();
    NoteRequest request("", NoteType::SOAP, "enc-3");
    ValidatedSections validated = renderer.validate(request, a);

    EXPECT_TRUE(validated.warnings.empty());
    EXPECT_DOUBLE_EQ(validated.completeness(), 1.0);
    EXPECT_EQ(validated.sections["objective"],
              "Respiratory: Lungs are clear to auscultation.\nResults: EKG");
    EXPECT_EQ(validated.sections["plan"], "- Obtain EKG\n- Troponin");
}

TEST_F(NoteRendererTest, RenderTitleAndHeadings) {
    ClinicalAssessment a = chestPainAssessment();

    NoteRequest soap("", NoteType::SOAP, "enc-4");
    std::string note = renderer.render(soap, renderer.validate(soap, a));
    EXPECT_EQ(note.rfind("SOAP NOTE\nEncounter: enc-4\n", 0), 0u);
    EXPECT_EQ(note.find("Phase:"), std::string::npos);
    EXPECT_NE(note.find("\nSUBJECTIVE:\nChief Complaint: Chest pain\n"), std::string::npos);
    EXPECT_LT(note.find("SUBJECTIVE:"), note.find("OBJECTIVE:"));
    EXPECT_LT(note.find("OBJECTIVE:"), note.find("ASSESSMENT:"));
    EXPECT_LT(note.find("ASSESSMENT:"), note.find("PLAN:"));

    NoteRequest ed("", NoteType::ED_NOTE, "enc-4", EncounterPhase::FOLLOW_UP);
    std::string ed_note = renderer.render(ed, renderer.validate(ed, a));
    EXPECT_EQ(ed_note.rfind("EMERGENCY DEPARTMENT NOTE\nEncounter: enc-4\nPhase: FollowUp\n", 0), 0u);
    EXPECT_NE(ed_note.find("DIFFERENTIAL DIAGNOSIS:\n1. Acute coronary syndrome (I20.9) - High likelihood"),
              std::string::npos);
    EXPECT_NE(ed_note.find("DISPOSITION:\nDischarge home"), std::string::npos);

    NoteRequest handoff("", NoteType::HANDOFF, "");
    std::string sbar = renderer.render(handoff, renderer.validate(handoff, a));
    EXPECT_EQ(sbar.rfind("HANDOFF (SBAR)\n\nSITUATION:\n", 0), 0u);
}

TEST_F(NoteRendererTest, SectionContentBuilders) {
    ClinicalAssessment a = chestPainAssessment();

    EXPECT_EQ(renderer.sectionContent("chief_complaint", a), "Chest pain");
    EXPECT_EQ(renderer.sectionContent("ros", a),
              "Cardiovascular: Positive for chest pain; Negative for palpitations.\n"
              "Respiratory: Negative for cough.");
    EXPECT_EQ(renderer.sectionContent("situation", a), "Patient with chest pain, moderate risk.");
    EXPECT_EQ(renderer.sectionContent("discharge_medications", a), "- Metformin 500 mg BID");
    EXPECT_EQ(renderer.sectionContent("reason_for_consult", a),
              "Chest pain; Cardiac risk: diabetes with chest pain");
    EXPECT_EQ(renderer.sectionContent("condition_at_discharge", a), "Stable");
    EXPECT_EQ(renderer.sectionContent("no_such_section", a), "");
}

TEST_F(NoteRendererTest, OptionalSectionsOmittedWhenEmpty) {
    ClinicalAssessment a = chestPainAssessment();
    NoteRequest request("", NoteType::ED_NOTE, "enc-5", EncounterPhase::FOLLOW_UP);
    ValidatedSections validated = renderer.validate(request, a);

    EXPECT_EQ(validated.sections.count("allergies"), 0u);
    EXPECT_EQ(validated.sections.count("family_history"), 0u);
    EXPECT_EQ(validated.sections.count("medications"), 1u);
    EXPECT_EQ(validated.required_count, 7u);
    EXPECT_EQ(validated.filled_count, 7u);
}

TEST_F(NoteRendererTest, JsonInitialPhase) {
    ClinicalAssessment a = chestPainAssessment();
    NoteRequest request("", NoteType::ED_NOTE, "enc-6", EncounterPhase::INITIAL);

    utils::JsonValue doc = utils::JsonParser::parse(renderer.renderJson(request, a));

    EXPECT_EQ(doc.getString("EncounterID"), "enc-6");
    EXPECT_EQ(doc.getString("Phase"), "Initial");
    EXPECT_EQ(doc.getString("ChiefComplaint"), "Chest pain");
    EXPECT_TRUE(doc.hasProperty("HPI"));
    ASSERT_TRUE(doc.hasProperty("ROS"));
    EXPECT_EQ(doc.getProperty("ROS").getString("Respiratory"), "Negative for cough");
    EXPECT_EQ(doc.getProperty("PE").getString("Respiratory"), "Lungs are clear to auscultation.");
    EXPECT_FALSE(doc.hasProperty("MDM"));
    EXPECT_FALSE(doc.hasProperty("Dispo"));
}

TEST_F(NoteRendererTest, JsonFollowUpPhase) {
    ClinicalAssessment a = chestPainAssessment();
    NoteRequest request("", NoteType::ED_NOTE, "enc-6", EncounterPhase::FOLLOW_UP);

    utils::JsonValue doc = utils::JsonParser::parse(renderer.renderJson(request, a));

    EXPECT_EQ(doc.getString("Phase"), "FollowUp");
    EXPECT_FALSE(doc.hasProperty("ChiefComplaint"));
    ASSERT_TRUE(doc.hasProperty("MDM"));
    const utils::JsonValue& mdm = doc.getProperty("MDM");
    ASSERT_EQ(mdm.getProperty("DDx").asArray().size(), 1u);
    EXPECT_EQ(mdm.getProperty("DDx").asArray()[0].getString("ICD10"), "I20.9");
    EXPECT_EQ(mdm.getProperty("Plan").asStringList(), (std::vector<std::string>{"Obtain EKG", "Troponin"}));
    EXPECT_EQ(mdm.getString("ClinicalReasoning"), a.mdm);
    EXPECT_EQ(doc.getString("FinalImpression"), a.final_impression);
    EXPECT_EQ(doc.getString("Dispo"), "Discharge home");
    EXPECT_EQ(doc.getString("DischargeInstructions"), a.discharge_instructions);
}

TEST_F(NoteRendererTest, JsonAlwaysCarriesIdentity) {
    NoteRequest request("", NoteType::ED_NOTE, "enc-7", EncounterPhase::FOLLOW_UP);

    utils::JsonValue doc = utils::JsonParser::parse(renderer.renderJson(request, ClinicalAssessment()));

    EXPECT_EQ(doc.asObject().size(), 2u);
    EXPECT_EQ(doc.getString("EncounterID"), "enc-7");
    EXPECT_EQ(doc.getString("Phase"), "FollowUp");
}

TEST_F(NoteRendererTest, CustomPlaceholder) {
    NoteRenderer custom("[pending]");
    NoteRequest request("", NoteType::PROGRESS, "enc-8");
    ValidatedSections validated = custom.validate(request, ClinicalAssessment());

    EXPECT_EQ(custom.getPlaceholder(), "[pending]");
    EXPECT_EQ(validated.sections["interval_history"], "[pending]");
}

TEST_F(NoteRendererTest, SectionVisibility) {
    SectionSpec initial{"hpi", "HPI", true, SectionPhase::INITIAL};
    SectionSpec follow{"mdm", "MDM", true, SectionPhase::FOLLOW_UP};
    SectionSpec any{"plan", "Plan", true, SectionPhase::ANY};

    EXPECT_TRUE(NoteRenderer::isVisible(initial, EncounterPhase::INITIAL));
    EXPECT_FALSE(NoteRenderer::isVisible(follow, EncounterPhase::INITIAL));
    EXPECT_TRUE(NoteRenderer::isVisible(any, EncounterPhase::INITIAL));
    EXPECT_TRUE(NoteRenderer::isVisible(initial, EncounterPhase::FOLLOW_UP));
    EXPECT_TRUE(NoteRenderer::isVisible(follow, EncounterPhase::FOLLOW_UP));
}
