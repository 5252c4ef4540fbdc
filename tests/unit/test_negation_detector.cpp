#include <gtest/gtest.h>
#include "clinical/negation_detector.hpp"

using namespace clinscribe::clinical;

class NegationDetectorTest : public ::testing::Test {
protected:
    NegationDetector detector;
};

TEST_F(NegationDetectorTest, DeniedVersusReported) {
    EXPECT_TRUE(detector.isNegated("Patient denies chest pain.", "chest pain"));
    EXPECT_FALSE(detector.isNegated("Patient reports chest pain.", "chest pain"));
}

TEST_F(NegationDetectorTest, CommonPreCues) {
    EXPECT_TRUE(detector.isNegated("No fever today.", "fever"));
    EXPECT_TRUE(detector.isNegated("She is without nausea", "nausea"));
    EXPECT_TRUE(detector.isNegated("Negative for hemoptysis", "hemoptysis"));
    EXPECT_TRUE(detector.isNegated("I don't have any chest pain", "chest pain"));
    EXPECT_TRUE(detector.isNegated("I deny any fever", "fever"));
}

TEST_F(NegationDetectorTest, PostCue) {
    EXPECT_TRUE(detector.isNegated("Pulmonary embolism ruled out on CT.", "pulmonary embolism"));
    EXPECT_FALSE(detector.isNegated("Pulmonary embolism, ruled out appendicitis.", "pulmonary embolism"));
}

TEST_F(NegationDetectorTest, PostCueBindsOnlyToItsOwnMention) {
    const std::string text = "He has chest pain with a negative troponin last week.";
    EXPECT_FALSE(detector.isNegated(text, "chest pain"));
    EXPECT_TRUE(detector.isNegated(text, "troponin"));

    EXPECT_TRUE(detector.isNegated("Troponin was negative.", "troponin"));
    EXPECT_TRUE(detector.isNegated("The d-dimer came back negative", "d-dimer"));
    EXPECT_FALSE(detector.isNegated("Chest pain and troponin negative", "chest pain"));
}

TEST_F(NegationDetectorTest, AffirmativeVerbEndsScope) {
    const std::string text = "Patient denies fever, has chest pain radiating to the jaw.";
    EXPECT_TRUE(detector.isNegated(text, "fever"));
    EXPECT_FALSE(detector.isNegated(text, "chest pain"));
    EXPECT_FALSE(detector.isNegated("No fever, having some cough", "cough"));

    // Negated forms of the same verbs keep the scope open
    EXPECT_TRUE(detector.isNegated("He does not have a cough", "cough"));
    EXPECT_TRUE(detector.isNegated("Denies having chest pain", "chest pain"));
    EXPECT_TRUE(detector.isNegated("I haven't had any nausea", "nausea"));
}

TEST_F(NegationDetectorTest, CommaListStaysInScope) {
    const std::string text = "Denies fever, chills, or night sweats.";
    EXPECT_TRUE(detector.isNegated(text, "fever"));
    EXPECT_TRUE(detector.isNegated(text, "chills"));
    EXPECT_TRUE(detector.isNegated(text, "night sweats"));
}

TEST_F(NegationDetectorTest, ScopeEndsAtSentenceAndTerminators) {
    EXPECT_FALSE(detector.isNegated("No fever. Cough for two days.", "cough"));
    EXPECT_FALSE(detector.isNegated("No fever; cough for two days.", "cough"));
    EXPECT_FALSE(detector.isNegated("Denies fever but endorses cough", "cough"));
    EXPECT_FALSE(detector.isNegated("Denies fever however has cough", "cough"));
}

TEST_F(NegationDetectorTest, PseudoNegationDoesNotNegate) {
    EXPECT_FALSE(detector.isNegated("No longer having nausea", "nausea"));
    EXPECT_FALSE(detector.isNegated("He is no longer short of breath", "short of breath"));
    EXPECT_FALSE(detector.isNegated("I am not taking warfarin", "warfarin"));
    EXPECT_FALSE(detector.isNegated("Not sure about the headache", "headache"));
}

TEST_F(NegationDetectorTest, CueOutsideWindowIsIgnored) {
    NegationDetector narrow(3);
    const std::string text = "No history of recent travel or chest pain";
    EXPECT_FALSE(narrow.isNegated(text, "chest pain"));
    EXPECT_TRUE(detector.isNegated(text, "chest pain"));
}

TEST_F(NegationDetectorTest, TermNotPresent) {
    EXPECT_FALSE(detector.isNegated("Denies fever", "cough"));
    EXPECT_FALSE(detector.isNegated("", "cough"));
    EXPECT_FALSE(detector.isNegated("Denies fever", ""));
}

TEST_F(NegationDetectorTest, TokenSpanInterface) {
    auto tokens = clinscribe::utils::tokenizeWithOffsets("denies headache, reports dizziness");
    // denies(0) headache(1) ,(2) reports(3) dizziness(4)
    EXPECT_TRUE(detector.isNegated(tokens, 1, 2));
    EXPECT_FALSE(detector.isNegated(tokens, 4, 5));
    EXPECT_FALSE(detector.isNegated(tokens, 2, 2));
    EXPECT_FALSE(detector.isNegated(tokens, 4, 9));
}

TEST_F(NegationDetectorTest, CustomCues) {
    EXPECT_FALSE(detector.isNegated("Patient refuses aspirin", "aspirin"));
    detector.addPreCue("Refuses");
    EXPECT_TRUE(detector.isNegated("Patient refuses aspirin", "aspirin"));

    EXPECT_FALSE(detector.isNegated("Pneumonia excluded by imaging", "pneumonia"));
    detector.addPostCue("excluded");
    EXPECT_TRUE(detector.isNegated("Pneumonia excluded by imaging", "pneumonia"));

    EXPECT_TRUE(detector.isNegated("No fever and cough", "cough"));
    detector.addTerminator("and");
    EXPECT_FALSE(detector.isNegated("No fever and cough", "cough"));
}
