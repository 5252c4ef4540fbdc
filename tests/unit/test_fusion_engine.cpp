#include <gtest/gtest.h>
#include "fusion/fusion_engine.hpp"
#include "fixtures/test_fixtures.hpp"
#include "utils/text_utils.hpp"
#include <random>

using namespace clinscribe;
using namespace clinscribe::fusion;
using fixtures::makeCandidate;

namespace {

// Counts whole-word hits of a fixed word list
class WordListLexicon : public DomainLexicon {
public:
    explicit WordListLexicon(std::vector<std::string> words) : words_(std::move(words)) {}

    size_t countDomainTerms(const std::string& text) const override {
        std::string lowered = utils::toLower(text);
        size_t count = 0;
        for (const auto& word : words_) {
            size_t pos = utils::findWholeWord(lowered, word);
            while (pos != std::string::npos) {
                count++;
                pos = utils::findWholeWord(lowered, word, pos + word.size());
            }
        }
        return count;
    }

private:
    std::vector<std::string> words_;
};

void expectSortedAndDisjoint(const std::vector<Segment>& segments) {
    for (size_t i = 1; i < segments.size(); ++i) {
        EXPECT_LE(segments[i - 1].start_time, segments[i].start_time);
        EXPECT_LE(segments[i - 1].end_time, segments[i].start_time)
            << "segments " << i - 1 << " and " << i << " overlap";
    }
}

} // namespace

class FusionEngineTest : public ::testing::Test {
protected:
    FusionEngine engine;
};

TEST_F(FusionEngineTest, EmptyInputGivesEmptyTranscript) {
    FusedTranscript fused = engine.fuse({});

    EXPECT_TRUE(fused.empty());
    EXPECT_FLOAT_EQ(fused.confidence, 0.0f);
    EXPECT_TRUE(fused.contributing_providers.empty());
}

TEST_F(FusionEngineTest, AllBlankCandidatesGiveEmptyTranscript) {
    FusedTranscript fused = engine.fuse({makeCandidate("a", "", 0.9f), makeCandidate("b", "   ", 0.8f)});

    EXPECT_TRUE(fused.text.empty());
    EXPECT_FLOAT_EQ(fused.confidence, 0.0f);
}

TEST_F(FusionEngineTest, SingleCandidatePassesThrough) {
    auto candidate = makeCandidate("whisper", "Patient reports  chest pain.", 0.37f, true);
    candidate.segments.emplace_back("Patient reports chest pain.", 0.0, 2.0, 0.37f);

    FusedTranscript fused = engine.fuse({candidate});

    EXPECT_EQ(fused.text, candidate.text);
    EXPECT_FLOAT_EQ(fused.confidence, 0.37f);
    ASSERT_EQ(fused.segments.size(), 1u);
    EXPECT_EQ(fused.contributing_providers, (std::vector<std::string>{"whisper"}));
}

TEST_F(FusionEngineTest, OnlyOneUsableCandidatePassesThrough) {
    FusedTranscript fused = engine.fuse({makeCandidate("silent", "", 0.99f),
                                         makeCandidate("speech", "no fever", 0.42f)});

    EXPECT_EQ(fused.text, "no fever");
    EXPECT_FLOAT_EQ(fused.confidence, 0.42f);
    EXPECT_EQ(fused.contributing_providers, (std::vector<std::string>{"speech"}));
}

TEST_F(FusionEngineTest, ChestPainTimingScenario) {
    FusedTranscript fused = engine.fuse({makeCandidate("a", "chest pain started two hours ago", 0.9f),
                                         makeCandidate("b", "chest pain started 2 hours ago", 0.6f)});

    EXPECT_EQ(fused.text, "chest pain started two hours ago");
    EXPECT_GT(fused.confidence, 0.6f);
    EXPECT_LT(fused.confidence, 0.9f);
    // (0.9 * 0.9 + 0.6 * 0.6) / 1.5
    EXPECT_NEAR(fused.confidence, 0.78f, 1e-5);
    EXPECT_GT(fused.confidence, 0.75f);
}

TEST_F(FusionEngineTest, WeightComputation) {
    FusionEngine lexicalEngine(core::FusionConfig(),
                               std::make_shared<WordListLexicon>(std::vector<std::string>{"troponin", "ekg"}));

    EXPECT_NEAR(lexicalEngine.computeWeight(makeCandidate("a", "nothing clinical", 0.5f)), 0.5, 1e-9);
    EXPECT_NEAR(lexicalEngine.computeWeight(makeCandidate("a", "nothing clinical", 0.5f, true)), 0.6, 1e-6);
    EXPECT_NEAR(lexicalEngine.computeWeight(makeCandidate("a", "ekg and troponin", 0.5f, true)),
                0.5 * 1.2 * 1.1, 1e-6);
    // Capped at maxWeight
    EXPECT_NEAR(lexicalEngine.computeWeight(makeCandidate("a", "ekg troponin", 0.95f, true)), 1.0, 1e-9);
    // Negative confidence never produces a negative weight
    EXPECT_NEAR(lexicalEngine.computeWeight(makeCandidate("a", "ekg", -0.5f)), 0.0, 1e-9);
}

TEST_F(FusionEngineTest, SpecialisedProviderWinsCloseVote) {
    FusedTranscript fused = engine.fuse({makeCandidate("general", "start heparin drip", 0.8f),
                                         makeCandidate("medical", "start heparin drop", 0.7f, true)});

    // 0.7 * 1.2 = 0.84 outweighs 0.8
    EXPECT_EQ(fused.text, "start heparin drop");
}

TEST_F(FusionEngineTest, TiesKeepFirstSubmittedToken) {
    FusedTranscript fused = engine.fuse({makeCandidate("a", "no fever", 0.5f),
                                         makeCandidate("b", "no fevers", 0.5f)});
    EXPECT_EQ(fused.text, "no fever");

    FusedTranscript swapped = engine.fuse({makeCandidate("b", "no fevers", 0.5f),
                                           makeCandidate("a", "no fever", 0.5f)});
    EXPECT_EQ(swapped.text, "no fevers");
}

TEST_F(FusionEngineTest, ShorterCandidatesDoNotPad) {
    FusedTranscript fused = engine.fuse({makeCandidate("a", "pain in the chest", 0.4f),
                                         makeCandidate("b", "pain in", 0.9f)});

    EXPECT_EQ(fused.text, "pain in the chest");
}

TEST_F(FusionEngineTest, PositionalVotingIsShiftSensitive) {
    std::vector<TranscriptionCandidate> candidates = {
        makeCandidate("a", "patient has chest pain today", 0.9f),
        makeCandidate("b", "patient has a chest pain today", 0.6f),
        makeCandidate("c", "patient chest pain today", 0.5f)
    };

    EXPECT_EQ(engine.fuse(candidates).text, "patient has chest pain today today");
}

TEST_F(FusionEngineTest, AlignedVotingToleratesInsertions) {
    core::FusionConfig config;
    config.votingStrategy = core::VotingStrategy::ALIGNED;
    FusionEngine aligned(config);

    std::vector<TranscriptionCandidate> candidates = {
        makeCandidate("a", "patient has chest pain today", 0.9f),
        makeCandidate("b", "patient has a chest pain today", 0.6f),
        makeCandidate("c", "patient chest pain today", 0.5f)
    };

    EXPECT_EQ(aligned.fuse(candidates).text, "patient has chest pain today");
}

TEST_F(FusionEngineTest, AlignedVotingOutvotesPivotSubstitution) {
    core::FusionConfig config;
    config.votingStrategy = core::VotingStrategy::ALIGNED;
    FusionEngine aligned(config);

    FusedTranscript fused = aligned.fuse({makeCandidate("a", "took warfrin daily", 0.7f),
                                          makeCandidate("b", "took warfarin daily", 0.5f),
                                          makeCandidate("c", "I took warfarin daily", 0.4f)});

    EXPECT_EQ(fused.text, "took warfarin daily");
}

TEST_F(FusionEngineTest, SegmentOverlapKeepsHeavierSource) {
    auto heavy = makeCandidate("heavy", "x", 0.9f);
    heavy.segments = {Segment("a0", 0.0, 1.0, 0.9f), Segment("a1", 1.0, 2.0, 0.9f)};
    auto light = makeCandidate("light", "x", 0.6f);
    light.segments = {Segment("b0", 0.5, 1.5, 0.6f), Segment("b1", 2.0, 3.0, 0.6f)};

    FusedTranscript fused = engine.fuse({heavy, light});

    ASSERT_EQ(fused.segments.size(), 3u);
    EXPECT_EQ(fused.segments[0].text, "a0");
    EXPECT_EQ(fused.segments[1].text, "a1");
    EXPECT_EQ(fused.segments[2].text, "b1");
    expectSortedAndDisjoint(fused.segments);
}

TEST_F(FusionEngineTest, HeavierLaterSegmentReplacesCurrent) {
    auto light = makeCandidate("light", "x", 0.5f);
    light.segments = {Segment("long", 0.0, 2.0, 0.5f)};
    auto heavy = makeCandidate("heavy", "x", 0.9f);
    heavy.segments = {Segment("short", 1.0, 3.0, 0.9f)};

    FusedTranscript fused = engine.fuse({light, heavy});

    ASSERT_EQ(fused.segments.size(), 1u);
    EXPECT_EQ(fused.segments[0].text, "short");
}

TEST_F(FusionEngineTest, EqualStartTimesResolveBySubmissionOrder) {
    auto first = makeCandidate("first", "x", 0.7f);
    first.segments = {Segment("first", 0.0, 1.0, 0.7f)};
    auto second = makeCandidate("second", "x", 0.7f);
    second.segments = {Segment("second", 0.0, 1.0, 0.7f)};

    EXPECT_EQ(engine.fuse({first, second}).segments.at(0).text, "first");
    EXPECT_EQ(engine.fuse({second, first}).segments.at(0).text, "second");
}

TEST_F(FusionEngineTest, InvertedSegmentsAreDropped) {
    auto a = makeCandidate("a", "x", 0.7f);
    a.segments = {Segment("bad", 2.0, 1.0, 0.7f), Segment("good", 3.0, 4.0, 0.7f)};
    auto b = makeCandidate("b", "x", 0.6f);

    FusedTranscript fused = engine.fuse({a, b});

    ASSERT_EQ(fused.segments.size(), 1u);
    EXPECT_EQ(fused.segments[0].text, "good");
}

TEST_F(FusionEngineTest, SegmentsNeverOverlap) {
    std::mt19937 gen(1234);
    std::uniform_real_distribution<double> startDist(0.0, 20.0);
    std::uniform_real_distribution<double> lengthDist(0.1, 4.0);
    std::uniform_real_distribution<float> confDist(0.1f, 1.0f);

    for (int trial = 0; trial < 50; ++trial) {
        std::vector<TranscriptionCandidate> candidates;
        for (int c = 0; c < 4; ++c) {
            auto candidate = makeCandidate("p" + std::to_string(c), "word", confDist(gen));
            for (int s = 0; s < 6; ++s) {
                double start = startDist(gen);
                candidate.segments.emplace_back("s", start, start + lengthDist(gen), candidate.overall_confidence);
            }
            candidates.push_back(candidate);
        }

        FusedTranscript fused = engine.fuse(candidates);
        ASSERT_FALSE(fused.segments.empty());
        expectSortedAndDisjoint(fused.segments);
    }
}

TEST_F(FusionEngineTest, FusionIsDeterministic) {
    auto a = makeCandidate("a", "the patient denies any chest pain", 0.8f);
    a.segments = {Segment("the patient", 0.0, 1.0, 0.8f), Segment("denies any chest pain", 1.0, 2.5, 0.8f)};
    auto b = makeCandidate("b", "the patient denies chest pain", 0.7f, true);
    b.segments = {Segment("the patient denies", 0.2, 1.4, 0.7f), Segment("chest pain", 1.4, 2.4, 0.7f)};
    auto c = makeCandidate("c", "a patient denies any chest pains", 0.5f);

    FusedTranscript first = engine.fuse({a, b, c});
    FusedTranscript second = engine.fuse({a, b, c});

    EXPECT_EQ(first.text, second.text);
    EXPECT_FLOAT_EQ(first.confidence, second.confidence);
    ASSERT_EQ(first.segments.size(), second.segments.size());
    for (size_t i = 0; i < first.segments.size(); ++i) {
        EXPECT_EQ(first.segments[i].text, second.segments[i].text);
        EXPECT_DOUBLE_EQ(first.segments[i].start_time, second.segments[i].start_time);
    }
    EXPECT_EQ(first.contributing_providers, second.contributing_providers);
}

// Confidence weights its own vote, so raising a candidate only raises the
// fused value while it stays at or above half of it. Every step below does.
TEST_F(FusionEngineTest, RaisingConfidenceNeverLowersFusedConfidence) {
    float previous = -1.0f;
    for (int step = 7; step <= 19; ++step) {
        float confidence = step * 0.05f;
        FusedTranscript fused = engine.fuse({makeCandidate("anchor", "chest pain today", 0.7f),
                                             makeCandidate("moving", "chest pains today", confidence)});
        EXPECT_GE(fused.confidence, previous - 1e-6f) << "at confidence " << confidence;
        previous = fused.confidence;
    }
}

TEST_F(FusionEngineTest, WeakCandidateBelowHalfFusedConfidenceLowersIt) {
    float silent = engine.fuse({makeCandidate("a", "see you soon", 0.9f),
                                makeCandidate("b", "see you soon", 0.0f)}).confidence;
    float weak = engine.fuse({makeCandidate("a", "see you soon", 0.9f),
                              makeCandidate("b", "see you soon", 0.1f)}).confidence;

    // (0.81 + 0.01) / (0.9 + 0.1)
    EXPECT_NEAR(silent, 0.9f, 1e-5);
    EXPECT_NEAR(weak, 0.82f, 1e-5);
}

TEST_F(FusionEngineTest, RaisingLeadingCandidateRaisesFusedConfidence) {
    float low = engine.fuse({makeCandidate("a", "no fever", 0.6f), makeCandidate("b", "no fever", 0.5f)}).confidence;
    float high = engine.fuse({makeCandidate("a", "no fever", 0.9f), makeCandidate("b", "no fever", 0.5f)}).confidence;

    EXPECT_GT(high, low);
}

TEST_F(FusionEngineTest, WeightedConfidenceHelper) {
    std::vector<TranscriptionCandidate> candidates = {makeCandidate("a", "x", 1.0f), makeCandidate("b", "x", 0.0f)};

    EXPECT_DOUBLE_EQ(FusionEngine::weightedConfidence(candidates, {3.0, 1.0}), 0.75);
    EXPECT_DOUBLE_EQ(FusionEngine::weightedConfidence(candidates, {0.0, 0.0}), 0.0);
}
