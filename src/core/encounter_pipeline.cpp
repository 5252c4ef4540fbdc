#include "core/encounter_pipeline.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace clinscribe {
namespace core {

EncounterPipeline::EncounterPipeline(const std::string& encounter_id,
                                     const EngineConfig& config,
                                     std::vector<fusion::TranscriptionProviderPtr> providers,
                                     clinical::VocabularyStorePtr vocabulary,
                                     std::shared_ptr<const clinical::EmbeddingModel> embeddings,
                                     utils::ErrorHandler& error_handler)
    : encounter_id_(encounter_id),
      config_(config),
      providers_(std::move(providers)),
      error_handler_(error_handler),
      task_queue_(std::make_shared<TaskQueue>()),
      thread_pool_(std::make_unique<ThreadPool>(static_cast<size_t>(std::max(1, config.fusion.workerThreads)))),
      gatherer_(task_queue_, std::chrono::milliseconds(config.fusion.providerTimeoutMs), error_handler),
      fusion_engine_(config.fusion, vocabulary),
      transcript_(encounter_id),
      note_generator_(vocabulary, std::move(embeddings), config, error_handler) {
}

EncounterPipeline::~EncounterPipeline() {
    stop();
}

void EncounterPipeline::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_pool_->isRunning()) {
        return;
    }
    thread_pool_->start(task_queue_);
    utils::Logger::info("Encounter pipeline started for '" + encounter_id_ + "' with " +
                        std::to_string(providers_.size()) + " providers");
}

void EncounterPipeline::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!thread_pool_->isRunning()) {
        return;
    }
    thread_pool_->stop();
    utils::Logger::info("Encounter pipeline stopped for '" + encounter_id_ + "'");
}

bool EncounterPipeline::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_pool_->isRunning();
}

void EncounterPipeline::setWindowCallback(WindowCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_callback_ = std::move(callback);
}

void EncounterPipeline::setStateCallback(clinical::StateCallback callback) {
    note_generator_.setStateCallback(std::move(callback));
}

WindowResult EncounterPipeline::appendFused(const std::string& window_id, fusion::GatherResult gather) {
    WindowResult result;
    result.window_id = window_id;
    if (!gather.discarded) {
        result.fused = fusion_engine_.fuse(gather.candidates);
        if (!result.fused.empty()) {
            transcript_.append(result.fused);
            result.appended = true;
        }
    }
    result.gather = std::move(gather);

    WindowCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = window_callback_;
    }
    if (callback) {
        callback(result);
    }
    return result;
}

WindowResult EncounterPipeline::processWindow(const fusion::AudioWindow& window,
                                              const fusion::CancellationToken& token,
                                              fusion::CancellationPolicy policy) {
    if (!isRunning()) {
        start();
    }
    utils::ErrorContext context("EncounterPipeline::processWindow", encounter_id_);
    fusion::GatherResult gather = gatherer_.gather(providers_, window, token, policy);
    WindowResult result = appendFused(window.window_id, std::move(gather));
    utils::Logger::debug("Window " + window.window_id + " fused from " +
                         std::to_string(result.gather.candidates.size()) + " candidates, confidence " +
                         std::to_string(result.fused.confidence));
    return result;
}

WindowResult EncounterPipeline::processCandidates(const std::string& window_id,
                                                  const std::vector<fusion::TranscriptionCandidate>& candidates) {
    fusion::GatherResult gather;
    gather.candidates = candidates;
    for (const auto& candidate : candidates) {
        fusion::ProviderReport report;
        report.provider_name = candidate.provider_name;
        report.outcome = fusion::ProviderOutcome::COMPLETED;
        gather.reports.push_back(report);
    }
    return appendFused(window_id, std::move(gather));
}

clinical::NoteResponse EncounterPipeline::generateNote(clinical::NoteType type,
                                                       clinical::EncounterPhase phase) const {
    clinical::NoteRequest request(transcript_.getText(), type, encounter_id_, phase);
    return note_generator_.generate(request);
}

} // namespace core
} // namespace clinscribe
