#include <gtest/gtest.h>
#include "fusion/encounter_transcript.hpp"
#include <thread>

using namespace clinscribe::fusion;

namespace {

FusedTranscript window(const std::string& text, float confidence, double start, double end) {
    FusedTranscript fused;
    fused.text = text;
    fused.confidence = confidence;
    if (end > start) {
        fused.segments.emplace_back(text, start, end, confidence);
    }
    return fused;
}

} // namespace

class EncounterTranscriptTest : public ::testing::Test {
protected:
    EncounterTranscript transcript{"enc-42"};
};

TEST_F(EncounterTranscriptTest, StartsEmpty) {
    EXPECT_EQ(transcript.getEncounterId(), "enc-42");
    EXPECT_EQ(transcript.windowCount(), 0u);
    EXPECT_EQ(transcript.getText(), "");
    EXPECT_FLOAT_EQ(transcript.getConfidence(), 0.0f);
}

TEST_F(EncounterTranscriptTest, JoinsWindowsInArrivalOrder) {
    transcript.append(window("I have chest pain.", 0.9f, 0.0, 2.0));
    transcript.append(window("   ", 0.0f, 0.0, 0.0));
    transcript.append(window(" It started this morning. ", 0.7f, 2.0, 4.0));

    EXPECT_EQ(transcript.windowCount(), 3u);
    EXPECT_EQ(transcript.getText(), "I have chest pain. It started this morning.");
    EXPECT_EQ(transcript.getSegments().size(), 2u);
}

TEST_F(EncounterTranscriptTest, ConfidenceWeightedByDuration) {
    transcript.append(window("long window", 0.9f, 0.0, 3.0));
    transcript.append(window("short window", 0.5f, 3.0, 4.0));

    // (0.9 * 3 + 0.5 * 1) / 4
    EXPECT_NEAR(transcript.getConfidence(), 0.8f, 1e-6);
}

TEST_F(EncounterTranscriptTest, ConfidenceWithoutTimingIsPlainMean) {
    transcript.append(window("one", 0.9f, 0.0, 0.0));
    transcript.append(window("two", 0.5f, 0.0, 0.0));

    EXPECT_NEAR(transcript.getConfidence(), 0.7f, 1e-6);
}

TEST_F(EncounterTranscriptTest, Clear) {
    transcript.append(window("text", 0.9f, 0.0, 1.0));
    transcript.clear();

    EXPECT_EQ(transcript.windowCount(), 0u);
    EXPECT_EQ(transcript.getText(), "");
}

TEST_F(EncounterTranscriptTest, ConcurrentAppends) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i) {
                transcript.append(window("w" + std::to_string(t), 0.5f, i, i + 1.0));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(transcript.windowCount(), 200u);
    EXPECT_EQ(transcript.getSegments().size(), 200u);
}
