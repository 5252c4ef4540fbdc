#pragma once

#include "clinical/clinical_types.hpp"
#include "clinical/embedding_model.hpp"
#include "clinical/entity_extractor.hpp"
#include "clinical/note_renderer.hpp"
#include "clinical/section_builder.hpp"
#include "clinical/sentence_deduplicator.hpp"
#include "clinical/sentence_fuser.hpp"
#include "clinical/vocabulary_store.hpp"
#include "core/engine_config.hpp"
#include "utils/error_handler.hpp"
#include <functional>
#include <memory>
#include <string>

namespace clinscribe {
namespace clinical {

enum class GenerationState {
    IDLE,
    EXTRACTING_ENTITIES,
    BUILDING_SECTIONS,
    VALIDATING,
    RENDERED
};

std::string generationStateToString(GenerationState state);

using StateCallback = std::function<void(const std::string& encounter_id, GenerationState state)>;

/**
 * Note generation entry point. Owns the extraction, deduplication, section
 * building and rendering stages and runs them per request:
 *
 *   IDLE -> EXTRACTING_ENTITIES -> BUILDING_SECTIONS -> VALIDATING -> RENDERED
 *
 * Requests are independent; generate() may be called concurrently once
 * the state callback is set.
 */
class NoteGenerator {
public:
    NoteGenerator(VocabularyStorePtr vocabulary,
                  std::shared_ptr<const EmbeddingModel> embeddings,
                  const core::EngineConfig& config,
                  utils::ErrorHandler& error_handler);

    /**
     * Throws EmptyInputException for an empty or whitespace-only
     * transcript; everything else degrades to placeholders and warnings.
     */
    NoteResponse generate(const NoteRequest& request) const;

    // Extraction, deduplication and section building without rendering
    ClinicalAssessment assess(const std::string& transcript) const;

    void setStateCallback(StateCallback callback);

    const EntityExtractor& getExtractor() const { return extractor_; }
    const SentenceDeduplicator& getDeduplicator() const { return deduplicator_; }
    const NoteRenderer& getRenderer() const { return renderer_; }

    static float qualityScore(const ValidatedSections& validated, const ClinicalAssessment& assessment);

private:
    void transition(GenerationState& state, GenerationState next, const std::string& encounter_id) const;

    VocabularyStorePtr vocabulary_;
    bool deduplication_enabled_;
    EntityExtractor extractor_;
    SentenceFuser fuser_;
    SentenceDeduplicator deduplicator_;
    SectionBuilder builder_;
    NoteRenderer renderer_;
    utils::ErrorHandler& error_handler_;
    StateCallback state_callback_;
};

} // namespace clinical
} // namespace clinscribe
