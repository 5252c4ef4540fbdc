#include "clinical/note_generator.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <chrono>

namespace clinscribe {
namespace clinical {

namespace {
const double kOldcartsElements = 8.0;
}

std::string generationStateToString(GenerationState state) {
    switch (state) {
        case GenerationState::IDLE: return "Idle";
        case GenerationState::EXTRACTING_ENTITIES: return "ExtractingEntities";
        case GenerationState::BUILDING_SECTIONS: return "BuildingSections";
        case GenerationState::VALIDATING: return "Validating";
        case GenerationState::RENDERED: return "Rendered";
    }
    return "Idle";
}

NoteGenerator::NoteGenerator(VocabularyStorePtr vocabulary,
                             std::shared_ptr<const EmbeddingModel> embeddings,
                             const core::EngineConfig& config,
                             utils::ErrorHandler& error_handler)
    : vocabulary_(vocabulary),
      deduplication_enabled_(config.deduplication.enabled),
      extractor_(vocabulary, static_cast<size_t>(std::max(1, config.extraction.windowTokens)),
                 config.extraction.applyRiskRules),
      fuser_(vocabulary, static_cast<size_t>(std::max(0, config.notes.minSentenceChars))),
      deduplicator_(std::move(embeddings), config.deduplication.similarityThreshold, error_handler),
      builder_(vocabulary, static_cast<size_t>(std::max(1, config.notes.maxHpiSentences))),
      renderer_(config.notes.placeholder),
      error_handler_(error_handler) {
}

void NoteGenerator::setStateCallback(StateCallback callback) {
    state_callback_ = std::move(callback);
}

void NoteGenerator::transition(GenerationState& state, GenerationState next, const std::string& encounter_id) const {
    utils::Logger::debug("Note generation " + encounter_id + ": " + generationStateToString(state) +
                         " -> " + generationStateToString(next));
    state = next;
    if (state_callback_) {
        state_callback_(encounter_id, state);
    }
}

ClinicalAssessment NoteGenerator::assess(const std::string& transcript) const {
    auto entities = extractor_.extract(transcript);
    auto sentences = fuser_.fuse(transcript);
    if (deduplication_enabled_) {
        sentences = deduplicator_.deduplicate(sentences);
    }
    return builder_.build(entities, sentences, transcript);
}

float NoteGenerator::qualityScore(const ValidatedSections& validated, const ClinicalAssessment& assessment) {
    double elements = static_cast<double>(assessment.hpi_elements.size()) / kOldcartsElements;
    double score = 0.6 * validated.completeness() + 0.4 * std::min(1.0, elements);
    return static_cast<float>(std::max(0.0, std::min(1.0, score)));
}

NoteResponse NoteGenerator::generate(const NoteRequest& request) const {
    utils::ErrorContext context("NoteGenerator", request.encounter_id);
    GenerationState state = GenerationState::IDLE;

    if (utils::isBlank(request.transcript_text)) {
        throw utils::EmptyInputException("Cannot generate a note from an empty transcript", request.encounter_id);
    }

    auto start = std::chrono::steady_clock::now();
    NoteResponse response;

    transition(state, GenerationState::EXTRACTING_ENTITIES, request.encounter_id);
    auto entities = extractor_.extract(request.transcript_text);
    auto sentences = fuser_.fuse(request.transcript_text);
    if (deduplication_enabled_) {
        if (!deduplicator_.isEnabled()) {
            response.warnings.push_back(utils::ErrorInfo(
                utils::ErrorCategory::DEDUPLICATION, utils::ErrorSeverity::WARNING,
                "Embeddings unavailable", "Sentence deduplication skipped", "ExtractingEntities",
                request.encounter_id));
        }
        sentences = deduplicator_.deduplicate(sentences);
    }

    transition(state, GenerationState::BUILDING_SECTIONS, request.encounter_id);
    ClinicalAssessment assessment = builder_.build(entities, sentences, request.transcript_text);

    transition(state, GenerationState::VALIDATING, request.encounter_id);
    ValidatedSections validated = renderer_.validate(request, assessment);
    for (const auto& warning : validated.warnings) {
        error_handler_.reportError(warning);
        response.warnings.push_back(warning);
    }

    response.rendered_note = renderer_.render(request, validated);
    response.sections = validated.sections;
    response.quality_score = qualityScore(validated, assessment);
    if (request.note_type == NoteType::ED_NOTE) {
        response.json_projection = renderer_.renderJson(request, assessment);
    }
    transition(state, GenerationState::RENDERED, request.encounter_id);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    utils::Logger::info("Generated " + noteTypeToString(request.note_type) + " note for encounter '" +
                        request.encounter_id + "' (" + std::to_string(entities.size()) + " entities, quality " +
                        std::to_string(response.quality_score) + ", " + std::to_string(elapsed) + " ms)");
    return response;
}

} // namespace clinical
} // namespace clinscribe
