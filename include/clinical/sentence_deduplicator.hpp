#pragma once

#include "clinical/clinical_types.hpp"
#include "clinical/embedding_model.hpp"
#include "utils/error_handler.hpp"
#include <memory>
#include <vector>

namespace clinscribe {
namespace clinical {

/**
 * Collapses semantically near-identical sentences.
 *
 * A sentence is a duplicate of a kept one when the cosine similarity of
 * their averaged word vectors exceeds the threshold. The kept sentence
 * absorbs the duplicate's source_count; the duplicate's wording replaces it
 * only when it carries a strictly higher source_count and is not itself a
 * duplicate of another kept sentence. Kept sentences are therefore pairwise
 * below the threshold and a second pass changes nothing.
 *
 * Without an available embedding model the input is returned unchanged and
 * an EmbeddingUnavailableException is recorded with the error handler.
 */
class SentenceDeduplicator {
public:
    SentenceDeduplicator(std::shared_ptr<const EmbeddingModel> model, float threshold,
                         utils::ErrorHandler& error_handler);

    std::vector<FusedSentence> deduplicate(const std::vector<FusedSentence>& sentences) const;

    bool isEnabled() const;
    float getThreshold() const { return threshold_; }

private:
    std::shared_ptr<const EmbeddingModel> model_;
    float threshold_;
    utils::ErrorHandler& error_handler_;
};

} // namespace clinical
} // namespace clinscribe
