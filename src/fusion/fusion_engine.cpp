#include "fusion/fusion_engine.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>

namespace clinscribe {
namespace fusion {

namespace {

struct WeightedSegment {
    const Segment* segment;
    double weight;
};

struct TokenTally {
    std::string token;
    double votes;
};

// Adds a vote, keeping tallies in first-seen order so ties resolve to the
// earliest candidate
void addVote(std::vector<TokenTally>& tallies, const std::string& token, double weight) {
    for (auto& tally : tallies) {
        if (tally.token == token) {
            tally.votes += weight;
            return;
        }
    }
    tallies.push_back({token, weight});
}

const TokenTally* pickWinner(const std::vector<TokenTally>& tallies) {
    const TokenTally* best = nullptr;
    for (const auto& tally : tallies) {
        if (!best || tally.votes > best->votes) {
            best = &tally;
        }
    }
    return best;
}

bool hasContent(const TranscriptionCandidate& candidate) {
    return !utils::isBlank(candidate.text) || !candidate.segments.empty();
}

} // namespace

FusionEngine::FusionEngine(const core::FusionConfig& config, std::shared_ptr<const DomainLexicon> lexicon)
    : config_(config), lexicon_(std::move(lexicon)) {
}

double FusionEngine::computeWeight(const TranscriptionCandidate& candidate) const {
    double weight = std::max(0.0, static_cast<double>(candidate.overall_confidence));

    if (candidate.domain_specialized) {
        weight *= config_.specializationBoost;
    }

    size_t termCount = lexicon_ ? lexicon_->countDomainTerms(candidate.text) : 0;
    if (termCount > 0) {
        weight *= 1.0 + static_cast<double>(termCount) * config_.domainTermBonus;
    }

    return std::min(weight, static_cast<double>(config_.maxWeight));
}

FusedTranscript FusionEngine::fuse(const std::vector<TranscriptionCandidate>& candidates) const {
    FusedTranscript result;

    // Candidates with neither text nor segments do not take part in voting
    // or in the confidence average
    std::vector<TranscriptionCandidate> usable;
    for (const auto& candidate : candidates) {
        if (hasContent(candidate)) {
            usable.push_back(candidate);
        }
    }

    bool anyText = std::any_of(usable.begin(), usable.end(),
                               [](const TranscriptionCandidate& c) { return !utils::isBlank(c.text); });
    if (!anyText) {
        utils::Logger::debug("Fusion skipped: no candidate produced text");
        return result;
    }

    std::vector<double> weights;
    weights.reserve(usable.size());
    for (const auto& candidate : usable) {
        weights.push_back(computeWeight(candidate));
        result.contributing_providers.push_back(candidate.provider_name);
    }

    result.segments = mergeSegments(usable, weights);

    if (usable.size() == 1) {
        result.text = usable.front().text;
        result.confidence = usable.front().overall_confidence;
        return result;
    }

    result.text = voteText(usable, weights);
    result.confidence = static_cast<float>(weightedConfidence(usable, weights));

    utils::Logger::debug("Fused " + std::to_string(usable.size()) + " candidates, confidence " +
                         std::to_string(result.confidence));
    return result;
}

std::string FusionEngine::voteText(const std::vector<TranscriptionCandidate>& candidates,
                                   const std::vector<double>& weights) const {
    std::vector<std::vector<std::string>> tokens;
    tokens.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        tokens.push_back(utils::splitWhitespace(candidate.text));
    }

    if (config_.votingStrategy == core::VotingStrategy::ALIGNED) {
        return voteAligned(tokens, weights);
    }
    return votePositional(tokens, weights);
}

std::string FusionEngine::votePositional(const std::vector<std::vector<std::string>>& tokens,
                                         const std::vector<double>& weights) const {
    size_t maxLength = 0;
    for (const auto& t : tokens) {
        maxLength = std::max(maxLength, t.size());
    }

    std::vector<std::string> merged;
    merged.reserve(maxLength);

    for (size_t position = 0; position < maxLength; ++position) {
        std::vector<TokenTally> tallies;
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (position < tokens[i].size()) {
                addVote(tallies, tokens[i][position], weights[i]);
            }
        }
        if (const TokenTally* winner = pickWinner(tallies)) {
            merged.push_back(winner->token);
        }
    }

    return utils::join(merged, " ");
}

std::string FusionEngine::voteAligned(const std::vector<std::vector<std::string>>& tokens,
                                      const std::vector<double>& weights) const {
    // Heaviest candidate that has any tokens; first one wins ties
    size_t pivotIndex = tokens.size();
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].empty()) {
            continue;
        }
        if (pivotIndex == tokens.size() || weights[i] > weights[pivotIndex]) {
            pivotIndex = i;
        }
    }
    if (pivotIndex == tokens.size()) {
        return "";
    }
    const auto& pivot = tokens[pivotIndex];

    std::vector<std::vector<int>> alignments(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i == pivotIndex) {
            std::vector<int> identity(pivot.size());
            for (size_t j = 0; j < pivot.size(); ++j) {
                identity[j] = static_cast<int>(j);
            }
            alignments[i] = identity;
        } else {
            alignments[i] = alignToPivot(pivot, tokens[i]);
        }
    }

    std::vector<std::string> merged;
    for (size_t column = 0; column < pivot.size(); ++column) {
        std::vector<TokenTally> tallies;
        for (size_t i = 0; i < tokens.size(); ++i) {
            int aligned = alignments[i][column];
            // An empty token is a vote to drop the column
            addVote(tallies, aligned >= 0 ? tokens[i][static_cast<size_t>(aligned)] : std::string(), weights[i]);
        }
        const TokenTally* winner = pickWinner(tallies);
        if (winner && !winner->token.empty()) {
            merged.push_back(winner->token);
        }
    }

    return utils::join(merged, " ");
}

std::vector<int> FusionEngine::alignToPivot(const std::vector<std::string>& pivot,
                                            const std::vector<std::string>& other) {
    const size_t n = pivot.size();
    const size_t m = other.size();

    std::vector<std::string> pivotLower(n), otherLower(m);
    for (size_t i = 0; i < n; ++i) pivotLower[i] = utils::toLower(pivot[i]);
    for (size_t j = 0; j < m; ++j) otherLower[j] = utils::toLower(other[j]);

    // Token-level edit distance
    std::vector<std::vector<size_t>> cost(n + 1, std::vector<size_t>(m + 1, 0));
    for (size_t i = 0; i <= n; ++i) cost[i][0] = i;
    for (size_t j = 0; j <= m; ++j) cost[0][j] = j;

    for (size_t i = 1; i <= n; ++i) {
        for (size_t j = 1; j <= m; ++j) {
            size_t substitution = cost[i - 1][j - 1] + (pivotLower[i - 1] == otherLower[j - 1] ? 0 : 1);
            size_t deletion = cost[i - 1][j] + 1;
            size_t insertion = cost[i][j - 1] + 1;
            cost[i][j] = std::min(substitution, std::min(deletion, insertion));
        }
    }

    std::vector<int> mapping(n, -1);
    size_t i = n;
    size_t j = m;
    while (i > 0 && j > 0) {
        size_t diagonal = cost[i - 1][j - 1] + (pivotLower[i - 1] == otherLower[j - 1] ? 0 : 1);
        if (cost[i][j] == diagonal) {
            mapping[i - 1] = static_cast<int>(j - 1);
            --i;
            --j;
        } else if (cost[i][j] == cost[i - 1][j] + 1) {
            --i;
        } else {
            --j;
        }
    }
    return mapping;
}

std::vector<Segment> FusionEngine::mergeSegments(const std::vector<TranscriptionCandidate>& candidates,
                                                 const std::vector<double>& weights) const {
    std::vector<WeightedSegment> all;
    for (size_t i = 0; i < candidates.size(); ++i) {
        for (const auto& segment : candidates[i].segments) {
            if (segment.end_time < segment.start_time) {
                utils::Logger::debug("Dropping segment with negative duration from " +
                                     candidates[i].provider_name);
                continue;
            }
            all.push_back({&segment, weights[i]});
        }
    }

    // Stable: equal start times keep submission order, then segment order
    std::stable_sort(all.begin(), all.end(),
                     [](const WeightedSegment& a, const WeightedSegment& b) {
                         return a.segment->start_time < b.segment->start_time;
                     });

    std::vector<Segment> merged;
    if (all.empty()) {
        return merged;
    }

    WeightedSegment current = all.front();
    for (size_t k = 1; k < all.size(); ++k) {
        const WeightedSegment& next = all[k];
        if (next.segment->start_time < current.segment->end_time) {
            if (next.weight > current.weight) {
                current = next;
            }
        } else {
            merged.push_back(*current.segment);
            current = next;
        }
    }
    merged.push_back(*current.segment);

    return merged;
}

double FusionEngine::weightedConfidence(const std::vector<TranscriptionCandidate>& candidates,
                                        const std::vector<double>& weights) {
    double weighted = 0.0;
    double total = 0.0;
    for (size_t i = 0; i < candidates.size() && i < weights.size(); ++i) {
        weighted += static_cast<double>(candidates[i].overall_confidence) * weights[i];
        total += weights[i];
    }
    return total > 0.0 ? weighted / total : 0.0;
}

} // namespace fusion
} // namespace clinscribe
