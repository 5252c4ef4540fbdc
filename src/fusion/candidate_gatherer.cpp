#include "fusion/candidate_gatherer.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>

namespace clinscribe {
namespace fusion {

namespace {

// Granularity at which a blocked join notices cancellation
const std::chrono::milliseconds kPollInterval(5);

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

std::string providerOutcomeToString(ProviderOutcome outcome) {
    switch (outcome) {
        case ProviderOutcome::COMPLETED: return "completed";
        case ProviderOutcome::TIMED_OUT: return "timed_out";
        case ProviderOutcome::FAILED: return "failed";
        case ProviderOutcome::CANCELLED: return "cancelled";
    }
    return "failed";
}

size_t GatherResult::countOutcome(ProviderOutcome outcome) const {
    return static_cast<size_t>(std::count_if(reports.begin(), reports.end(),
                                             [outcome](const ProviderReport& r) { return r.outcome == outcome; }));
}

CandidateGatherer::CandidateGatherer(std::shared_ptr<core::TaskQueue> task_queue,
                                     std::chrono::milliseconds provider_timeout,
                                     utils::ErrorHandler& error_handler)
    : task_queue_(std::move(task_queue)),
      provider_timeout_(provider_timeout),
      error_handler_(error_handler) {
}

GatherResult CandidateGatherer::gather(const std::vector<TranscriptionProviderPtr>& providers,
                                       const AudioWindow& window,
                                       const CancellationToken& token,
                                       CancellationPolicy policy) const {
    if (providers.empty()) {
        throw utils::EmptyInputException("No transcription providers configured for window " + window.window_id);
    }
    if (std::any_of(providers.begin(), providers.end(),
                    [](const TranscriptionProviderPtr& p) { return !p; })) {
        throw std::invalid_argument("Null transcription provider");
    }

    // Shared so tasks that outlive this call still see valid audio
    auto sharedWindow = std::make_shared<const AudioWindow>(window);
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + provider_timeout_;
    // Cancelled when gather returns so late providers free their workers
    CancellationToken windowToken = token.child();

    std::vector<std::future<TranscriptionCandidate>> futures;
    futures.reserve(providers.size());
    for (const auto& provider : providers) {
        futures.push_back(task_queue_->enqueueWithFuture(
            core::TaskPriority::HIGH,
            [provider, sharedWindow, windowToken]() {
                TranscriptionCandidate candidate = provider->transcribe(*sharedWindow, windowToken);
                if (candidate.provider_name.empty()) {
                    candidate.provider_name = provider->getName();
                }
                candidate.domain_specialized = candidate.domain_specialized || provider->isDomainSpecialized();
                return candidate;
            }));
    }

    GatherResult result;

    for (size_t i = 0; i < futures.size(); ++i) {
        ProviderReport report;
        report.provider_name = providers[i]->getName();

        auto& future = futures[i];
        std::future_status status = std::future_status::timeout;
        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (token.isCancelled()) {
                status = future.wait_for(std::chrono::milliseconds(0));
                break;
            }
            if (now >= deadline) {
                status = future.wait_for(std::chrono::milliseconds(0));
                break;
            }
            auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kPollInterval);
            status = future.wait_for(slice);
            if (status == std::future_status::ready) {
                break;
            }
        }

        report.latency_ms = elapsedMs(started);

        if (status == std::future_status::ready) {
            try {
                result.candidates.push_back(future.get());
                report.outcome = ProviderOutcome::COMPLETED;
            } catch (const std::exception& e) {
                report.outcome = ProviderOutcome::FAILED;
                report.detail = e.what();
                error_handler_.reportError(utils::ErrorInfo(
                    utils::ErrorCategory::PROVIDER, utils::ErrorSeverity::ERROR,
                    "Provider failed", report.provider_name + ": " + e.what(),
                    "CandidateGatherer"));
            }
        } else if (token.isCancelled()) {
            report.outcome = ProviderOutcome::CANCELLED;
            report.detail = "capture stopped";
        } else {
            report.outcome = ProviderOutcome::TIMED_OUT;
            report.detail = "exceeded " + std::to_string(provider_timeout_.count()) + " ms";
            error_handler_.reportError(utils::ProviderTimeoutException(
                report.provider_name, static_cast<long>(provider_timeout_.count())));
        }

        result.reports.push_back(report);
    }

    windowToken.cancel();
    result.cancelled = token.isCancelled();

    if (result.cancelled) {
        if (policy == CancellationPolicy::DISCARD_WINDOW) {
            utils::Logger::info("Window " + window.window_id + " discarded after capture stop");
            result.candidates.clear();
            result.discarded = true;
        } else {
            utils::Logger::info("Window " + window.window_id + " cancelled, fusing " +
                                std::to_string(result.candidates.size()) + " completed candidates");
        }
        return result;
    }

    if (result.candidates.empty()) {
        throw utils::AllProvidersFailedException(window.window_id, providers.size());
    }

    utils::Logger::debug("Window " + window.window_id + ": " + std::to_string(result.candidates.size()) +
                         "/" + std::to_string(providers.size()) + " providers completed");
    return result;
}

} // namespace fusion
} // namespace clinscribe
