#include "clinical/sentence_deduplicator.hpp"
#include "utils/logging.hpp"
#include <optional>

namespace clinscribe {
namespace clinical {

SentenceDeduplicator::SentenceDeduplicator(std::shared_ptr<const EmbeddingModel> model, float threshold,
                                           utils::ErrorHandler& error_handler)
    : model_(std::move(model)), threshold_(threshold), error_handler_(error_handler) {}

bool SentenceDeduplicator::isEnabled() const {
    return model_ && model_->isAvailable();
}

std::vector<FusedSentence> SentenceDeduplicator::deduplicate(const std::vector<FusedSentence>& sentences) const {
    if (!isEnabled()) {
        utils::EmbeddingUnavailableException unavailable("Deduplication skipped: no word embeddings loaded");
        error_handler_.reportError(unavailable, "SentenceDeduplicator", utils::ErrorContext::getCurrentEncounterId());
        return sentences;
    }

    struct Kept {
        FusedSentence sentence;
        std::optional<std::vector<float>> vector;
    };
    std::vector<Kept> kept;
    size_t merged = 0;

    for (const auto& sentence : sentences) {
        auto vector = model_->sentenceVector(sentence.content);
        if (!vector) {
            kept.push_back(Kept{sentence, std::nullopt});
            continue;
        }

        size_t match = kept.size();
        for (size_t k = 0; k < kept.size(); ++k) {
            if (kept[k].vector &&
                EmbeddingModel::cosineSimilarity(*vector, *kept[k].vector) > threshold_) {
                match = k;
                break;
            }
        }
        if (match == kept.size()) {
            kept.push_back(Kept{sentence, vector});
            continue;
        }

        merged++;
        Kept& target = kept[match];
        int absorbed = target.sentence.source_count + sentence.source_count;

        bool replace = sentence.source_count > target.sentence.source_count;
        if (replace) {
            for (size_t k = 0; k < kept.size(); ++k) {
                if (k != match && kept[k].vector &&
                    EmbeddingModel::cosineSimilarity(*vector, *kept[k].vector) > threshold_) {
                    replace = false;
                    break;
                }
            }
        }
        if (replace) {
            size_t order = target.sentence.order;
            target.sentence = sentence;
            target.sentence.order = order;
            target.vector = vector;
        }
        target.sentence.source_count = absorbed;
    }

    std::vector<FusedSentence> result;
    result.reserve(kept.size());
    for (auto& entry : kept) {
        result.push_back(entry.sentence);
    }
    if (merged > 0) {
        utils::Logger::debug("Deduplication merged " + std::to_string(merged) + " sentences");
    }
    return result;
}

} // namespace clinical
} // namespace clinscribe
