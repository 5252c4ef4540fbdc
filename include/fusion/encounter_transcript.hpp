#pragma once

#include "fusion/fusion_types.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace clinscribe {
namespace fusion {

/**
 * Accumulates the fused windows of one encounter in arrival order.
 * Thread-safe; windows are appended by the capture thread while note
 * generation reads snapshots.
 */
class EncounterTranscript {
public:
    explicit EncounterTranscript(const std::string& encounter_id = "");

    void append(const FusedTranscript& window);

    const std::string& getEncounterId() const { return encounter_id_; }
    size_t windowCount() const;
    std::vector<FusedTranscript> getWindows() const;

    // Window texts joined with single spaces, empty windows skipped
    std::string getText() const;
    std::vector<Segment> getSegments() const;

    /**
     * Mean window confidence weighted by segment duration. Falls back to the
     * plain mean when no window carries timing; 0 for an empty encounter.
     */
    float getConfidence() const;

    void clear();

private:
    std::string encounter_id_;
    std::vector<FusedTranscript> windows_;
    mutable std::mutex mutex_;
};

} // namespace fusion
} // namespace clinscribe
