#pragma once

#include "core/engine_config.hpp"
#include "fusion/domain_lexicon.hpp"
#include "fusion/fusion_types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace clinscribe {
namespace fusion {

/**
 * ROVER-style combination of N transcriptions of the same audio window.
 *
 * Each candidate gets a weight from its confidence, its specialisation flag
 * and the number of domain terms it contains. Text is produced by weighted
 * token voting, segments by a time-ordered overlap walk that keeps the
 * heavier source, and confidence is the weight-averaged candidate
 * confidence. The engine holds no mutable state; fuse() may be called
 * concurrently.
 */
class FusionEngine {
public:
    explicit FusionEngine(const core::FusionConfig& config = core::FusionConfig(),
                          std::shared_ptr<const DomainLexicon> lexicon = nullptr);

    FusedTranscript fuse(const std::vector<TranscriptionCandidate>& candidates) const;

    double computeWeight(const TranscriptionCandidate& candidate) const;

    // Exposed for tests and for callers that already hold weights
    std::string voteText(const std::vector<TranscriptionCandidate>& candidates,
                         const std::vector<double>& weights) const;
    std::vector<Segment> mergeSegments(const std::vector<TranscriptionCandidate>& candidates,
                                       const std::vector<double>& weights) const;
    static double weightedConfidence(const std::vector<TranscriptionCandidate>& candidates,
                                     const std::vector<double>& weights);

    const core::FusionConfig& getConfig() const { return config_; }

private:
    std::string votePositional(const std::vector<std::vector<std::string>>& tokens,
                               const std::vector<double>& weights) const;
    std::string voteAligned(const std::vector<std::vector<std::string>>& tokens,
                            const std::vector<double>& weights) const;

    // For every pivot token, the index of the aligned token in other, or -1
    // when the alignment deletes it
    static std::vector<int> alignToPivot(const std::vector<std::string>& pivot,
                                         const std::vector<std::string>& other);

    core::FusionConfig config_;
    std::shared_ptr<const DomainLexicon> lexicon_;
};

} // namespace fusion
} // namespace clinscribe
