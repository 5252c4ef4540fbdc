#pragma once

#include "core/task_queue.hpp"
#include "fusion/transcription_provider.hpp"
#include "utils/error_handler.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace clinscribe {
namespace fusion {

/**
 * What to do with a window whose capture was stopped before every provider
 * answered. Always chosen by the caller.
 */
enum class CancellationPolicy {
    FUSE_COMPLETED,   // keep candidates that finished before the stop
    DISCARD_WINDOW    // drop the whole window
};

enum class ProviderOutcome {
    COMPLETED,
    TIMED_OUT,
    FAILED,
    CANCELLED
};

std::string providerOutcomeToString(ProviderOutcome outcome);

struct ProviderReport {
    std::string provider_name;
    ProviderOutcome outcome;
    std::string detail;
    double latency_ms;

    ProviderReport() : outcome(ProviderOutcome::FAILED), latency_ms(0.0) {}
};

struct GatherResult {
    // Completed candidates in provider submission order
    std::vector<TranscriptionCandidate> candidates;
    // One entry per provider, submission order
    std::vector<ProviderReport> reports;
    bool cancelled = false;
    bool discarded = false;

    size_t countOutcome(ProviderOutcome outcome) const;
};

/**
 * Runs every provider for one audio window as a task on the shared queue
 * and joins them against a single deadline.
 *
 * A provider that misses the deadline or throws is excluded and reported to
 * the error handler; the call only fails when no provider completed.
 * Each provider sees a per-window child of the caller's token, cancelled
 * once the join ends, so a timed-out provider that polls its token gives
 * its worker back before the next window.
 */
class CandidateGatherer {
public:
    CandidateGatherer(std::shared_ptr<core::TaskQueue> task_queue,
                      std::chrono::milliseconds provider_timeout,
                      utils::ErrorHandler& error_handler);

    /**
     * @throws utils::EmptyInputException if providers is empty
     * @throws utils::AllProvidersFailedException if nothing completed and the
     *         window was not cancelled
     */
    GatherResult gather(const std::vector<TranscriptionProviderPtr>& providers,
                        const AudioWindow& window,
                        const CancellationToken& token,
                        CancellationPolicy policy) const;

    std::chrono::milliseconds getProviderTimeout() const { return provider_timeout_; }

private:
    std::shared_ptr<core::TaskQueue> task_queue_;
    std::chrono::milliseconds provider_timeout_;
    utils::ErrorHandler& error_handler_;
};

} // namespace fusion
} // namespace clinscribe
