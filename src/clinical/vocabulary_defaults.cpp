#include "clinical/vocabulary_store.hpp"

namespace clinscribe {
namespace clinical {

namespace {

struct TermRow {
    const char* phrase;
    const char* canonical;
    const char* category;
};

const TermRow kSymptoms[] = {
    {"chest pain", "chest pain", "Cardiovascular"},
    {"chest pressure", "chest pain", "Cardiovascular"},
    {"chest tightness", "chest pain", "Cardiovascular"},
    {"chest discomfort", "chest pain", "Cardiovascular"},
    {"palpitations", "palpitations", "Cardiovascular"},
    {"heart racing", "palpitations", "Cardiovascular"},
    {"leg swelling", "leg swelling", "Cardiovascular"},
    {"swollen legs", "leg swelling", "Cardiovascular"},
    {"swelling in my legs", "leg swelling", "Cardiovascular"},
    {"shortness of breath", "shortness of breath", "Respiratory"},
    {"short of breath", "shortness of breath", "Respiratory"},
    {"trouble breathing", "shortness of breath", "Respiratory"},
    {"difficulty breathing", "shortness of breath", "Respiratory"},
    {"dyspnea", "shortness of breath", "Respiratory"},
    {"cough", "cough", "Respiratory"},
    {"coughing", "cough", "Respiratory"},
    {"wheezing", "wheezing", "Respiratory"},
    {"coughing up blood", "hemoptysis", "Respiratory"},
    {"hemoptysis", "hemoptysis", "Respiratory"},
    {"orthopnea", "orthopnea", "Respiratory"},
    {"fever", "fever", "Constitutional"},
    {"fevers", "fever", "Constitutional"},
    {"chills", "chills", "Constitutional"},
    {"fatigue", "fatigue", "Constitutional"},
    {"weight loss", "weight loss", "Constitutional"},
    {"night sweats", "night sweats", "Constitutional"},
    {"diaphoresis", "diaphoresis", "Constitutional"},
    {"sweaty", "diaphoresis", "Constitutional"},
    {"sweating", "diaphoresis", "Constitutional"},
    {"headache", "headache", "Neurological"},
    {"headaches", "headache", "Neurological"},
    {"dizziness", "dizziness", "Neurological"},
    {"dizzy", "dizziness", "Neurological"},
    {"lightheaded", "lightheadedness", "Neurological"},
    {"lightheadedness", "lightheadedness", "Neurological"},
    {"syncope", "syncope", "Neurological"},
    {"passed out", "syncope", "Neurological"},
    {"fainted", "syncope", "Neurological"},
    {"numbness", "numbness", "Neurological"},
    {"weakness", "weakness", "Neurological"},
    {"confusion", "confusion", "Neurological"},
    {"neck stiffness", "neck stiffness", "Neurological"},
    {"stiff neck", "neck stiffness", "Neurological"},
    {"vision changes", "vision changes", "Neurological"},
    {"blurry vision", "vision changes", "Neurological"},
    {"photophobia", "photophobia", "Neurological"},
    {"sensitivity to light", "photophobia", "Neurological"},
    {"nausea", "nausea", "Gastrointestinal"},
    {"nauseous", "nausea", "Gastrointestinal"},
    {"vomiting", "vomiting", "Gastrointestinal"},
    {"throwing up", "vomiting", "Gastrointestinal"},
    {"diarrhea", "diarrhea", "Gastrointestinal"},
    {"constipation", "constipation", "Gastrointestinal"},
    {"abdominal pain", "abdominal pain", "Gastrointestinal"},
    {"stomach pain", "abdominal pain", "Gastrointestinal"},
    {"belly pain", "abdominal pain", "Gastrointestinal"},
    {"blood in stool", "blood in stool", "Gastrointestinal"},
    {"bloody stool", "blood in stool", "Gastrointestinal"},
    {"heartburn", "heartburn", "Gastrointestinal"},
    {"painful urination", "dysuria", "Genitourinary"},
    {"burning with urination", "dysuria", "Genitourinary"},
    {"dysuria", "dysuria", "Genitourinary"},
    {"urinary symptoms", "urinary symptoms", "Genitourinary"},
    {"frequent urination", "urinary frequency", "Genitourinary"},
    {"blood in urine", "hematuria", "Genitourinary"},
    {"hematuria", "hematuria", "Genitourinary"},
    {"back pain", "back pain", "Musculoskeletal"},
    {"joint pain", "joint pain", "Musculoskeletal"},
    {"calf pain", "calf pain", "Musculoskeletal"},
    {"leg pain", "leg pain", "Musculoskeletal"},
    {"rash", "rash", "Skin"},
    {"sore throat", "sore throat", "HEENT"},
};

const TermRow kMedications[] = {
    {"blood thinner", "blood thinner", "anticoagulant"},
    {"blood thinners", "blood thinner", "anticoagulant"},
    {"warfarin", "warfarin", "anticoagulant"},
    {"coumadin", "warfarin", "anticoagulant"},
    {"eliquis", "apixaban", "anticoagulant"},
    {"apixaban", "apixaban", "anticoagulant"},
    {"xarelto", "rivaroxaban", "anticoagulant"},
    {"rivaroxaban", "rivaroxaban", "anticoagulant"},
    {"heparin", "heparin", "anticoagulant"},
    {"lovenox", "enoxaparin", "anticoagulant"},
    {"enoxaparin", "enoxaparin", "anticoagulant"},
    {"aspirin", "aspirin", "antiplatelet"},
    {"plavix", "clopidogrel", "antiplatelet"},
    {"clopidogrel", "clopidogrel", "antiplatelet"},
    {"birth control", "oral contraceptive", "hormonal_contraceptive"},
    {"birth control pills", "oral contraceptive", "hormonal_contraceptive"},
    {"oral contraceptive", "oral contraceptive", "hormonal_contraceptive"},
    {"lisinopril", "lisinopril", "antihypertensive"},
    {"losartan", "losartan", "antihypertensive"},
    {"amlodipine", "amlodipine", "antihypertensive"},
    {"metoprolol", "metoprolol", "beta_blocker"},
    {"metformin", "metformin", "antidiabetic"},
    {"insulin", "insulin", "antidiabetic"},
    {"atorvastatin", "atorvastatin", "statin"},
    {"lipitor", "atorvastatin", "statin"},
    {"simvastatin", "simvastatin", "statin"},
    {"nitroglycerin", "nitroglycerin", "nitrate"},
    {"ibuprofen", "ibuprofen", "analgesic"},
    {"advil", "ibuprofen", "analgesic"},
    {"motrin", "ibuprofen", "analgesic"},
    {"tylenol", "acetaminophen", "analgesic"},
    {"acetaminophen", "acetaminophen", "analgesic"},
    {"albuterol", "albuterol", "bronchodilator"},
    {"inhaler", "albuterol", "bronchodilator"},
    {"omeprazole", "omeprazole", "acid_suppressant"},
};

const TermRow kConditions[] = {
    {"blood clot", "venous thromboembolism", "vte_history"},
    {"blood clots", "venous thromboembolism", "vte_history"},
    {"dvt", "venous thromboembolism", "vte_history"},
    {"deep vein thrombosis", "venous thromboembolism", "vte_history"},
    {"pulmonary embolism", "venous thromboembolism", "vte_history"},
    {"diabetes", "diabetes mellitus", "diabetes"},
    {"diabetic", "diabetes mellitus", "diabetes"},
    {"hypertension", "hypertension", "hypertension"},
    {"high blood pressure", "hypertension", "hypertension"},
    {"high cholesterol", "hyperlipidemia", "hyperlipidemia"},
    {"hyperlipidemia", "hyperlipidemia", "hyperlipidemia"},
    {"smoker", "tobacco use", "tobacco_use"},
    {"smokes", "tobacco use", "tobacco_use"},
    {"smoking", "tobacco use", "tobacco_use"},
    {"cigarettes", "tobacco use", "tobacco_use"},
    {"tobacco", "tobacco use", "tobacco_use"},
    {"alcohol", "alcohol use", "alcohol_use"},
    {"heart attack", "myocardial infarction", "coronary_artery_disease"},
    {"coronary artery disease", "coronary artery disease", "coronary_artery_disease"},
    {"stent", "coronary artery disease", "coronary_artery_disease"},
    {"asthma", "asthma", "lung_disease"},
    {"copd", "chronic obstructive pulmonary disease", "lung_disease"},
    {"cancer", "cancer", "malignancy"},
    {"pregnant", "pregnancy", "pregnancy"},
    {"migraines", "migraine", "migraine"},
    {"kidney stones", "nephrolithiasis", "nephrolithiasis"},
};

const TermRow kProcedures[] = {
    {"ekg", "EKG", "cardiac"},
    {"ecg", "EKG", "cardiac"},
    {"electrocardiogram", "EKG", "cardiac"},
    {"troponin", "troponin", "labs"},
    {"d-dimer", "D-dimer", "labs"},
    {"d dimer", "D-dimer", "labs"},
    {"blood work", "basic labs", "labs"},
    {"labs", "basic labs", "labs"},
    {"cbc", "CBC", "labs"},
    {"urinalysis", "urinalysis", "labs"},
    {"chest x-ray", "chest X-ray", "imaging"},
    {"chest xray", "chest X-ray", "imaging"},
    {"ct scan", "CT", "imaging"},
    {"cat scan", "CT", "imaging"},
    {"ultrasound", "ultrasound", "imaging"},
    {"mri", "MRI", "imaging"},
};

DifferentialTemplate differential(const std::string& diagnosis, const std::string& icd10,
                                  const std::string& likelihood,
                                  const std::vector<std::string>& supporting,
                                  const std::vector<std::string>& workup) {
    DifferentialTemplate d;
    d.diagnosis = diagnosis;
    d.icd10 = icd10;
    d.likelihood = likelihood;
    d.supporting = supporting;
    d.workup = workup;
    return d;
}

EntityPattern pattern(EntityKind kind, const std::string& category, const std::string& name = "") {
    EntityPattern p;
    p.kind = kind;
    p.category = category;
    p.name = name;
    return p;
}

} // namespace

void VocabularyStore::loadDefaults() {
    for (const auto& row : kSymptoms) {
        addTerm(VocabularyTerm(row.phrase, row.canonical, EntityKind::SYMPTOM, row.category));
    }
    for (const auto& row : kMedications) {
        addTerm(VocabularyTerm(row.phrase, row.canonical, EntityKind::MEDICATION, row.category));
    }
    for (const auto& row : kConditions) {
        addTerm(VocabularyTerm(row.phrase, row.canonical, EntityKind::CONDITION, row.category));
    }
    for (const auto& row : kProcedures) {
        addTerm(VocabularyTerm(row.phrase, row.canonical, EntityKind::PROCEDURE, row.category));
    }

    for (const char* word : {"mild", "slight", "moderate", "severe", "terrible", "excruciating", "worst"}) {
        addPhrase(severity_, word, word);
    }
    addPhrase(severity_, "really bad", "severe");
    addPhrase(severity_, "very bad", "severe");

    for (const char* word : {"sharp", "dull", "aching", "burning", "pressure", "squeezing", "stabbing",
                             "throbbing", "tearing", "crushing", "tight", "cramping", "pounding",
                             "heavy", "pleuritic"}) {
        addPhrase(quality_, word, word);
    }
    addPhrase(quality_, "like an elephant", "pressure");
    addPhrase(quality_, "comes and goes", "intermittent");

    for (const char* word : {"left arm", "right arm", "arm", "jaw", "neck", "back", "lower back",
                             "upper back", "shoulder", "left shoulder", "right shoulder", "chest",
                             "left side", "right side", "abdomen", "stomach", "epigastric",
                             "substernal", "head", "forehead", "temples", "behind my eyes", "leg",
                             "left leg", "right leg", "calf", "lower abdomen",
                             "right lower quadrant", "left lower quadrant", "flank"}) {
        addPhrase(location_, word, word);
    }

    addPhrase(route_, "by mouth", "PO");
    addPhrase(route_, "po", "PO");
    addPhrase(route_, "orally", "PO");
    addPhrase(route_, "iv", "IV");
    addPhrase(route_, "intravenous", "IV");
    addPhrase(route_, "injection", "SC");
    addPhrase(route_, "subcutaneous", "SC");
    addPhrase(route_, "shot", "SC");
    addPhrase(route_, "inhaled", "inhaled");
    addPhrase(route_, "puffs", "inhaled");

    addPhrase(frequency_, "once a day", "daily");
    addPhrase(frequency_, "once daily", "daily");
    addPhrase(frequency_, "every day", "daily");
    addPhrase(frequency_, "daily", "daily");
    addPhrase(frequency_, "twice a day", "BID");
    addPhrase(frequency_, "twice daily", "BID");
    addPhrase(frequency_, "bid", "BID");
    addPhrase(frequency_, "three times a day", "TID");
    addPhrase(frequency_, "tid", "TID");
    addPhrase(frequency_, "at bedtime", "QHS");
    addPhrase(frequency_, "nightly", "QHS");
    addPhrase(frequency_, "as needed", "PRN");
    addPhrase(frequency_, "prn", "PRN");

    // Priority order: the first phrase found in the transcript decides
    disposition_.emplace_back("admit", "Admit");
    disposition_.emplace_back("admitted", "Admit");
    disposition_.emplace_back("admission", "Admit");
    disposition_.emplace_back("observation", "Observation");
    disposition_.emplace_back("transfer", "Transfer");
    disposition_.emplace_back("discharge", "Discharge home");
    disposition_.emplace_back("go home", "Discharge home");
    disposition_.emplace_back("going home", "Discharge home");
    disposition_.emplace_back("send you home", "Discharge home");

    addPhrase(exam_, "vital signs", "Vitals");
    addPhrase(exam_, "blood pressure is", "Vitals");
    addPhrase(exam_, "heart rate is", "Vitals");
    addPhrase(exam_, "no acute distress", "General");
    addPhrase(exam_, "alert and oriented", "General");
    addPhrase(exam_, "lungs", "Respiratory");
    addPhrase(exam_, "breath sounds", "Respiratory");
    addPhrase(exam_, "clear to auscultation", "Respiratory");
    addPhrase(exam_, "heart sounds", "Cardiovascular");
    addPhrase(exam_, "murmur", "Cardiovascular");
    addPhrase(exam_, "regular rate and rhythm", "Cardiovascular");
    addPhrase(exam_, "abdomen is", "Abdomen");
    addPhrase(exam_, "abdomen soft", "Abdomen");
    addPhrase(exam_, "tender to palpation", "Abdomen");
    addPhrase(exam_, "cranial nerves", "Neurological");
    addPhrase(exam_, "strength is", "Neurological");
    addPhrase(exam_, "edema", "Extremities");
    addPhrase(exam_, "calf tenderness", "Extremities");

    ComplaintProfile chest;
    chest.complaint = "chest pain";
    chest.expected_findings = {"shortness of breath", "diaphoresis", "nausea", "palpitations",
                               "lightheadedness", "leg swelling"};
    chest.differentials = {
        differential("Acute coronary syndrome", "I20.9", "High",
                     {"pressure", "crushing", "squeezing", "jaw", "arm", "left arm", "diaphoresis",
                      "shortness of breath", "nausea"},
                     {"ECG", "Troponin", "CXR", "CBC", "BMP", "PT/INR"}),
        differential("Pulmonary embolism", "I26.99", "Medium",
                     {"pleuritic", "shortness of breath", "hemoptysis", "leg swelling", "calf pain",
                      "palpitations"},
                     {"D-dimer", "CTA chest", "ECG", "Troponin", "BNP"}),
        differential("Gastroesophageal reflux", "K21.9", "Medium",
                     {"burning", "heartburn", "epigastric"},
                     {"ECG to rule out cardiac", "Consider GI cocktail trial"}),
        differential("Costochondritis", "M94.0", "Low",
                     {"sharp", "stabbing"},
                     {"ECG to rule out cardiac", "CXR if respiratory symptoms"}),
    };
    chest.mdm_focus = "Evaluation is directed at excluding acute coronary syndrome, pulmonary embolism "
                      "and aortic dissection.";
    chest.discharge_instructions = "Return immediately for worsening chest pain, shortness of breath, "
                                   "fainting or sweating.";
    addComplaintProfile(chest);

    ComplaintProfile headache;
    headache.complaint = "headache";
    headache.expected_findings = {"vision changes", "neck stiffness", "fever", "photophobia",
                                  "vomiting", "confusion"};
    headache.differentials = {
        differential("Migraine", "G43.909", "High",
                     {"throbbing", "pounding", "photophobia", "nausea", "vomiting"},
                     {"Neurological exam", "Consider CT/MRI if red flags"}),
        differential("Tension headache", "G44.209", "High",
                     {"pressure", "tight", "forehead", "temples"},
                     {"Clinical diagnosis", "Neurological exam"}),
        differential("Subarachnoid hemorrhage", "I60.9", "Low",
                     {"worst", "neck stiffness", "syncope", "vomiting"},
                     {"CT head without contrast", "LP if CT negative", "CTA if SAH confirmed"}),
        differential("Meningitis", "G03.9", "Low",
                     {"fever", "neck stiffness", "photophobia", "confusion", "rash"},
                     {"CBC", "Blood cultures", "LP", "CT head before LP if indicated"}),
    };
    headache.mdm_focus = "Evaluation is directed at excluding intracranial hemorrhage and meningitis.";
    headache.discharge_instructions = "Return immediately for the worst headache of your life, fever, "
                                      "stiff neck, confusion or weakness.";
    addComplaintProfile(headache);

    ComplaintProfile abdominal;
    abdominal.complaint = "abdominal pain";
    abdominal.expected_findings = {"nausea", "vomiting", "diarrhea", "constipation", "fever",
                                   "blood in stool"};
    abdominal.differentials = {
        differential("Acute appendicitis", "K35.80", "High",
                     {"right lower quadrant", "fever", "nausea", "vomiting"},
                     {"CBC with differential", "CMP", "Urinalysis", "CT abdomen/pelvis",
                      "Pregnancy test (if applicable)"}),
        differential("Gastroenteritis", "K52.9", "Medium",
                     {"nausea", "vomiting", "diarrhea", "cramping"},
                     {"CBC", "BMP", "Stool studies if indicated"}),
        differential("Urinary tract infection", "N39.0", "Medium",
                     {"dysuria", "urinary frequency", "hematuria", "lower abdomen"},
                     {"Urinalysis", "Urine culture", "CBC if systemic symptoms"}),
        differential("Kidney stone", "N20.0", "Low",
                     {"flank", "hematuria", "back pain", "cramping"},
                     {"Urinalysis", "BMP", "CT abdomen/pelvis without contrast"}),
    };
    abdominal.mdm_focus = "Evaluation is directed at excluding surgical abdomen and obstruction.";
    abdominal.discharge_instructions = "Return immediately for worsening abdominal pain, persistent "
                                       "vomiting, fever or blood in the stool.";
    addComplaintProfile(abdominal);

    ComplaintProfile dyspnea;
    dyspnea.complaint = "shortness of breath";
    dyspnea.expected_findings = {"chest pain", "cough", "fever", "leg swelling", "orthopnea", "wheezing"};
    dyspnea.differentials = {
        differential("Pneumonia", "J18.9", "High",
                     {"fever", "cough", "pleuritic", "chills"},
                     {"CXR", "CBC", "BMP", "Blood cultures if severe", "Procalcitonin"}),
        differential("Congestive heart failure exacerbation", "I50.9", "Medium",
                     {"orthopnea", "leg swelling"},
                     {"CXR", "BNP", "Troponin", "ECG", "Echo if new diagnosis"}),
        differential("Asthma exacerbation", "J45.901", "Medium",
                     {"wheezing", "cough"},
                     {"Peak flow", "CXR", "ABG if severe"}),
        differential("Pulmonary embolism", "I26.99", "Low",
                     {"pleuritic", "hemoptysis", "palpitations", "calf pain", "leg swelling"},
                     {"D-dimer", "CTA chest", "V/Q scan if contraindication to CTA"}),
    };
    dyspnea.mdm_focus = "Evaluation is directed at excluding pulmonary embolism, pneumonia and "
                        "heart failure.";
    dyspnea.discharge_instructions = "Return immediately for worsening shortness of breath, chest pain "
                                     "or coughing up blood.";
    addComplaintProfile(dyspnea);

    ComplaintProfile fever;
    fever.complaint = "fever";
    fever.expected_findings = {"cough", "sore throat", "urinary symptoms", "rash", "headache",
                               "neck stiffness"};
    fever.mdm_focus = "Evaluation is directed at identifying a source of infection and excluding sepsis.";
    fever.discharge_instructions = "Return immediately for fever that does not improve, confusion, "
                                   "stiff neck or difficulty breathing.";
    addComplaintProfile(fever);

    RiskRule vte;
    vte.id = "vte_anticoagulation_gap";
    vte.patterns.push_back(pattern(EntityKind::CONDITION, "vte_history"));
    EntityPattern stopped = pattern(EntityKind::MEDICATION, "anticoagulant");
    stopped.status = EntityStatus::DISCONTINUED;
    vte.patterns.push_back(stopped);
    EntityPattern elapsed = pattern(EntityKind::TIMING_MARKER, "");
    elapsed.min_elapsed_days = 0;
    vte.patterns.push_back(elapsed);
    vte.output_name = "HIGH RISK: VTE with anticoagulation gap";
    vte.severity_label = "high";
    vte.category = "thromboembolic";
    vte.promotes = "Pulmonary embolism";
    vte.plan_item = "Evaluate for recurrent venous thromboembolism and address anticoagulation gap";
    addRiskRule(vte);

    RiskRule diabetes;
    diabetes.id = "diabetes_chest_pain";
    diabetes.patterns = {pattern(EntityKind::CONDITION, "diabetes"),
                         pattern(EntityKind::SYMPTOM, "", "chest pain")};
    diabetes.output_name = "Cardiac risk: diabetes with chest pain";
    diabetes.severity_label = "moderate";
    diabetes.category = "cardiac";
    diabetes.promotes = "Acute coronary syndrome";
    addRiskRule(diabetes);

    RiskRule hypertension;
    hypertension.id = "hypertension_chest_pain";
    hypertension.patterns = {pattern(EntityKind::CONDITION, "hypertension"),
                             pattern(EntityKind::SYMPTOM, "", "chest pain")};
    hypertension.output_name = "Cardiac risk: hypertension with chest pain";
    hypertension.severity_label = "moderate";
    hypertension.category = "cardiac";
    hypertension.promotes = "Acute coronary syndrome";
    addRiskRule(hypertension);

    RiskRule tobacco;
    tobacco.id = "tobacco_chest_pain";
    tobacco.patterns = {pattern(EntityKind::CONDITION, "tobacco_use"),
                        pattern(EntityKind::SYMPTOM, "Cardiovascular")};
    tobacco.output_name = "Cardiac risk: tobacco use with cardiovascular symptoms";
    tobacco.severity_label = "moderate";
    tobacco.category = "cardiac";
    tobacco.promotes = "Acute coronary syndrome";
    addRiskRule(tobacco);

    RiskRule cad;
    cad.id = "known_cad_chest_pain";
    cad.patterns = {pattern(EntityKind::CONDITION, "coronary_artery_disease"),
                    pattern(EntityKind::SYMPTOM, "", "chest pain")};
    cad.output_name = "HIGH RISK: known coronary disease with chest pain";
    cad.severity_label = "high";
    cad.category = "cardiac";
    cad.promotes = "Acute coronary syndrome";
    cad.plan_item = "Serial troponins and cardiology consultation";
    addRiskRule(cad);

    RiskRule bleed;
    bleed.id = "anticoagulated_headache";
    EntityPattern active_anticoagulant = pattern(EntityKind::MEDICATION, "anticoagulant");
    active_anticoagulant.status = EntityStatus::ACTIVE;
    bleed.patterns = {active_anticoagulant, pattern(EntityKind::SYMPTOM, "", "headache")};
    bleed.output_name = "HIGH RISK: headache on anticoagulation";
    bleed.severity_label = "high";
    bleed.category = "bleeding";
    bleed.promotes = "Subarachnoid hemorrhage";
    bleed.plan_item = "Emergent non-contrast CT head and coagulation studies";
    addRiskRule(bleed);

    RiskRule contraceptive;
    contraceptive.id = "contraceptive_dyspnea";
    contraceptive.patterns = {pattern(EntityKind::MEDICATION, "hormonal_contraceptive"),
                              pattern(EntityKind::SYMPTOM, "", "shortness of breath")};
    contraceptive.output_name = "VTE risk: hormonal contraception with shortness of breath";
    contraceptive.severity_label = "moderate";
    contraceptive.category = "thromboembolic";
    contraceptive.promotes = "Pulmonary embolism";
    addRiskRule(contraceptive);
}

} // namespace clinical
} // namespace clinscribe
