#pragma once

#include "fusion/fusion_types.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace clinscribe {
namespace fusion {

/**
 * Shared flag raised when capture stops mid-window. Providers should poll it
 * and return early; the gatherer stops waiting once it is set.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    /**
     * New token that reports cancelled when either it or this token is
     * cancelled. Cancelling the child leaves this token untouched.
     */
    CancellationToken child() const {
        CancellationToken token;
        token.state_->parent = state_;
        return token;
    }

    void cancel() { state_->cancelled.store(true); }

    bool isCancelled() const {
        for (const State* state = state_.get(); state; state = state->parent.get()) {
            if (state->cancelled.load()) {
                return true;
            }
        }
        return false;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        // Set once before the token is shared
        std::shared_ptr<const State> parent;
    };

    std::shared_ptr<State> state_;
};

/**
 * Abstract interface for a transcription source (acoustic model, platform
 * recognizer, specialised model). Implementations must be safe to call from
 * a worker thread.
 */
class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;

    virtual std::string getName() const = 0;

    // Domain-specialised providers get extra voting weight
    virtual bool isDomainSpecialized() const = 0;

    /**
     * Transcribe one window. May throw; the gatherer records the failure and
     * fuses the remaining providers.
     */
    virtual TranscriptionCandidate transcribe(const AudioWindow& window,
                                              const CancellationToken& token) = 0;
};

using TranscriptionProviderPtr = std::shared_ptr<TranscriptionProvider>;

} // namespace fusion
} // namespace clinscribe
