#pragma once

#include "clinical/embedding_model.hpp"
#include "clinical/note_generator.hpp"
#include "clinical/vocabulary_store.hpp"
#include "core/engine_config.hpp"
#include "core/task_queue.hpp"
#include "fusion/candidate_gatherer.hpp"
#include "fusion/encounter_transcript.hpp"
#include "fusion/fusion_engine.hpp"
#include "fusion/transcription_provider.hpp"
#include "utils/error_handler.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clinscribe {
namespace core {

/**
 * Result of processing one audio window
 */
struct WindowResult {
    std::string window_id;
    fusion::FusedTranscript fused;
    fusion::GatherResult gather;
    // False when the window was discarded or nothing was fused
    bool appended;

    WindowResult() : appended(false) {}
};

using WindowCallback = std::function<void(const WindowResult& result)>;

/**
 * One encounter end to end: provider fan-out per audio window, fusion into
 * the encounter transcript, and note generation from the accumulated text.
 */
class EncounterPipeline {
public:
    EncounterPipeline(const std::string& encounter_id,
                      const EngineConfig& config,
                      std::vector<fusion::TranscriptionProviderPtr> providers,
                      clinical::VocabularyStorePtr vocabulary,
                      std::shared_ptr<const clinical::EmbeddingModel> embeddings,
                      utils::ErrorHandler& error_handler);
    ~EncounterPipeline();

    EncounterPipeline(const EncounterPipeline&) = delete;
    EncounterPipeline& operator=(const EncounterPipeline&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    /**
     * Gathers candidates from every provider, fuses them and appends the
     * result. Throws AllProvidersFailedException when no provider completed.
     */
    WindowResult processWindow(const fusion::AudioWindow& window,
                               const fusion::CancellationToken& token,
                               fusion::CancellationPolicy policy);

    // Fuses candidates that were gathered elsewhere and appends the result
    WindowResult processCandidates(const std::string& window_id,
                                   const std::vector<fusion::TranscriptionCandidate>& candidates);

    clinical::NoteResponse generateNote(clinical::NoteType type,
                                        clinical::EncounterPhase phase = clinical::EncounterPhase::INITIAL) const;

    void setWindowCallback(WindowCallback callback);
    void setStateCallback(clinical::StateCallback callback);

    const std::string& getEncounterId() const { return encounter_id_; }
    const fusion::EncounterTranscript& getTranscript() const { return transcript_; }
    const fusion::FusionEngine& getFusionEngine() const { return fusion_engine_; }

private:
    WindowResult appendFused(const std::string& window_id, fusion::GatherResult gather);

    std::string encounter_id_;
    EngineConfig config_;
    std::vector<fusion::TranscriptionProviderPtr> providers_;
    utils::ErrorHandler& error_handler_;

    std::shared_ptr<TaskQueue> task_queue_;
    std::unique_ptr<ThreadPool> thread_pool_;
    fusion::CandidateGatherer gatherer_;
    fusion::FusionEngine fusion_engine_;
    fusion::EncounterTranscript transcript_;
    clinical::NoteGenerator note_generator_;

    WindowCallback window_callback_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace clinscribe
