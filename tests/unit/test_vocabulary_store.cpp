#include <gtest/gtest.h>
#include "clinical/vocabulary_store.hpp"
#include "fixtures/test_fixtures.hpp"
#include "utils/json_utils.hpp"
#include <filesystem>

using namespace clinscribe;
using namespace clinscribe::clinical;

class VocabularyStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.loadDefaults();
    }

    void merge(const std::string& json) {
        store.mergeJson(utils::JsonParser::parse(json), "inline");
    }

    VocabularyStore store;
};

TEST_F(VocabularyStoreTest, DefaultTablesArePopulated) {
    EXPECT_GT(store.termCount(), 100u);
    EXPECT_EQ(store.getRiskRules().size(), 7u);
    EXPECT_EQ(store.getRiskRules().front().id, "vte_anticoagulation_gap");
    EXPECT_EQ(store.getComplaintProfiles().size(), 5u);
    EXPECT_FALSE(store.severityTable().empty());
    EXPECT_FALSE(store.dispositionTable().empty());
}

TEST_F(VocabularyStoreTest, TermsAreOrderedLongestFirst) {
    const auto& terms = store.getTerms();
    for (size_t i = 1; i < terms.size(); ++i) {
        EXPECT_GE(terms[i - 1].phrase.size(), terms[i].phrase.size()) << terms[i].phrase;
    }
}

TEST_F(VocabularyStoreTest, CanonicalLookup) {
    const VocabularyTerm* sob = store.findCanonical(EntityKind::SYMPTOM, "shortness of breath");
    ASSERT_NE(sob, nullptr);
    EXPECT_EQ(sob->category, "Respiratory");

    const VocabularyTerm* warfarin = store.findCanonical(EntityKind::MEDICATION, "warfarin");
    ASSERT_NE(warfarin, nullptr);
    EXPECT_EQ(warfarin->category, "anticoagulant");

    EXPECT_EQ(store.findCanonical(EntityKind::CONDITION, "warfarin"), nullptr);
}

TEST_F(VocabularyStoreTest, ComplaintProfileLookupIgnoresCase) {
    const ComplaintProfile* chest = store.findComplaintProfile("Chest Pain");
    ASSERT_NE(chest, nullptr);
    EXPECT_EQ(chest->differentials.size(), 4u);
    EXPECT_EQ(chest->differentials.front().diagnosis, "Acute coronary syndrome");

    EXPECT_NE(store.findComplaintProfile("headache"), nullptr);
    EXPECT_EQ(store.findComplaintProfile("toothache"), nullptr);
}

TEST_F(VocabularyStoreTest, CountDomainTerms) {
    EXPECT_EQ(store.countDomainTerms("Patient on Warfarin with chest pain and chest pressure"), 3u);
    // The longer phrase claims the text first
    EXPECT_EQ(store.countDomainTerms("history of blood clots"), 1u);
    EXPECT_EQ(store.countDomainTerms("fevers and a fever"), 2u);
    EXPECT_EQ(store.countDomainTerms("the weather is nice"), 0u);
    EXPECT_EQ(store.countDomainTerms(""), 0u);
}

TEST_F(VocabularyStoreTest, AddTermNormalizesAndReplaces) {
    size_t before = store.termCount();
    store.addTerm(VocabularyTerm("  Tenting ", "poor skin turgor", EntityKind::SYMPTOM, "Skin"));
    store.addTerm(VocabularyTerm("tenting", "skin tenting", EntityKind::SYMPTOM, "Skin"));
    store.addTerm(VocabularyTerm("   ", "ignored", EntityKind::SYMPTOM, "Skin"));

    EXPECT_EQ(store.termCount(), before + 1);
    const VocabularyTerm* term = store.findCanonical(EntityKind::SYMPTOM, "skin tenting");
    ASSERT_NE(term, nullptr);
    EXPECT_EQ(term->phrase, "tenting");
    EXPECT_EQ(store.findCanonical(EntityKind::SYMPTOM, "poor skin turgor"), nullptr);
}

TEST_F(VocabularyStoreTest, MergeJsonExtendsTables) {
    size_t before = store.termCount();
    merge(R"json({
        "terms": [
            {"phrase": "Tenting", "name": "poor skin turgor", "category": "Skin"},
            {"phrase": "xarelto", "name": "rivaroxaban (Xarelto)", "kind": "medication",
             "category": "anticoagulant"}
        ],
        "pertinent_negatives": {
            "Back Pain": ["fever", "numbness"],
            "chest pain": ["syncope"]
        },
        "risk_rules": [
            {"id": "smoker_dyspnea", "output": "Respiratory risk: tobacco use with dyspnea",
             "patterns": [{"kind": "condition", "category": "tobacco_use"},
                          {"kind": "symptom", "name": "shortness of breath"}]}
        ]
    })json");

    // xarelto replaces the built-in medication row
    EXPECT_EQ(store.termCount(), before + 1);
    const VocabularyTerm* tenting = store.findCanonical(EntityKind::SYMPTOM, "poor skin turgor");
    ASSERT_NE(tenting, nullptr);
    EXPECT_EQ(tenting->phrase, "tenting");
    EXPECT_NE(store.findCanonical(EntityKind::MEDICATION, "rivaroxaban (Xarelto)"), nullptr);

    const ComplaintProfile* back = store.findComplaintProfile("back pain");
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->expected_findings, (std::vector<std::string>{"fever", "numbness"}));

    const ComplaintProfile* chest = store.findComplaintProfile("chest pain");
    ASSERT_NE(chest, nullptr);
    EXPECT_EQ(chest->expected_findings, std::vector<std::string>{"syncope"});
    EXPECT_EQ(chest->differentials.size(), 4u);

    ASSERT_EQ(store.getRiskRules().size(), 8u);
    const RiskRule& rule = store.getRiskRules().back();
    EXPECT_EQ(rule.id, "smoker_dyspnea");
    EXPECT_EQ(rule.severity_label, "moderate");
    ASSERT_EQ(rule.patterns.size(), 2u);
    EXPECT_EQ(rule.patterns[0].kind, EntityKind::CONDITION);
    EXPECT_EQ(rule.patterns[1].name, "shortness of breath");
}

TEST_F(VocabularyStoreTest, MergeJsonRuleOptions) {
    merge(R"({"risk_rules": [
        {"id": "vte_anticoagulation_gap", "output": "Replaced rule", "severity": "high",
         "patterns": [{"kind": "medication", "status": "Discontinued", "allow_negated": true},
                      {"kind": "timing_marker", "min_elapsed_days": 30}]}
    ]})");

    ASSERT_EQ(store.getRiskRules().size(), 7u);
    const RiskRule& rule = store.getRiskRules().front();
    EXPECT_EQ(rule.output_name, "Replaced rule");
    ASSERT_TRUE(rule.patterns[0].status.has_value());
    EXPECT_EQ(*rule.patterns[0].status, EntityStatus::DISCONTINUED);
    EXPECT_TRUE(rule.patterns[0].allow_negated);
    EXPECT_EQ(rule.patterns[1].kind, EntityKind::TIMING_MARKER);
    EXPECT_EQ(rule.patterns[1].min_elapsed_days.value_or(-1), 30);
}

TEST_F(VocabularyStoreTest, MergeJsonRejectsMalformedInput) {
    EXPECT_THROW(merge("[]"), utils::VocabularyLoadException);
    EXPECT_THROW(merge(R"({"terms": {"phrase": "x"}})"), utils::VocabularyLoadException);
    EXPECT_THROW(merge(R"({"terms": [{"name": "no phrase"}]})"), utils::VocabularyLoadException);
    EXPECT_THROW(merge(R"({"terms": [{"phrase": "x", "kind": "organ"}]})"), utils::VocabularyLoadException);
    EXPECT_THROW(merge(R"({"pertinent_negatives": {"cough": "fever"}})"), utils::VocabularyLoadException);
    EXPECT_THROW(merge(R"({"risk_rules": [{"id": "r", "output": "o"}]})"), utils::VocabularyLoadException);
    EXPECT_THROW(merge(R"({"risk_rules": [{"output": "o", "patterns": [{"kind": "symptom"}]}]})"),
                 utils::VocabularyLoadException);
    EXPECT_THROW(merge(R"({"risk_rules": [{"id": "r", "output": "o",
                          "patterns": [{"kind": "symptom", "status": "chronic"}]}]})"),
                 utils::VocabularyLoadException);
}

TEST_F(VocabularyStoreTest, LoadFromFile) {
    std::string path = fixtures::writeTempFile("vocabulary.json",
        R"({"terms": [{"phrase": "racing heart", "name": "palpitations", "category": "Cardiovascular"}]})");

    VocabularyStorePtr loaded = VocabularyStore::loadFromFile(path);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->termCount(), VocabularyStore::createDefault()->termCount() + 1);
    EXPECT_EQ(loaded->countDomainTerms("my racing heart"), 1u);

    std::filesystem::remove(path);
}

TEST_F(VocabularyStoreTest, LoadFromFileErrors) {
    try {
        VocabularyStore::loadFromFile("/nonexistent/clinscribe/vocabulary.json");
        FAIL() << "Expected VocabularyLoadException";
    } catch (const utils::VocabularyLoadException& e) {
        EXPECT_EQ(e.getErrorInfo().category, utils::ErrorCategory::VOCABULARY);
        EXPECT_EQ(e.getErrorInfo().details, "/nonexistent/clinscribe/vocabulary.json");
    }

    std::string path = fixtures::writeTempFile("broken.json", "{\"terms\": [");
    EXPECT_THROW(VocabularyStore::loadFromFile(path), utils::VocabularyLoadException);
    std::filesystem::remove(path);
}

TEST_F(VocabularyStoreTest, EntityPatternMatching) {
    ClinicalEntity gap;
    gap.kind = EntityKind::TIMING_MARKER;
    gap.name = "six weeks ago";
    gap.elapsed_days = 42;

    EntityPattern elapsed;
    elapsed.kind = EntityKind::TIMING_MARKER;
    elapsed.min_elapsed_days = 0;
    EXPECT_TRUE(elapsed.matches(gap));

    elapsed.min_elapsed_days = 42;
    EXPECT_FALSE(elapsed.matches(gap));

    ClinicalEntity warfarin;
    warfarin.kind = EntityKind::MEDICATION;
    warfarin.name = "warfarin";
    warfarin.category = "anticoagulant";

    EntityPattern stopped;
    stopped.kind = EntityKind::MEDICATION;
    stopped.category = "anticoagulant";
    stopped.status = EntityStatus::DISCONTINUED;
    EXPECT_FALSE(stopped.matches(warfarin));
    warfarin.status = EntityStatus::DISCONTINUED;
    EXPECT_TRUE(stopped.matches(warfarin));

    warfarin.is_negated = true;
    EXPECT_FALSE(stopped.matches(warfarin));
    stopped.allow_negated = true;
    EXPECT_TRUE(stopped.matches(warfarin));
}
