#include "fusion/encounter_transcript.hpp"
#include "utils/text_utils.hpp"

namespace clinscribe {
namespace fusion {

EncounterTranscript::EncounterTranscript(const std::string& encounter_id)
    : encounter_id_(encounter_id) {
}

void EncounterTranscript::append(const FusedTranscript& window) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.push_back(window);
}

size_t EncounterTranscript::windowCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

std::vector<FusedTranscript> EncounterTranscript::getWindows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_;
}

std::string EncounterTranscript::getText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> parts;
    for (const auto& window : windows_) {
        std::string text = utils::trim(window.text);
        if (!text.empty()) {
            parts.push_back(text);
        }
    }
    return utils::join(parts, " ");
}

std::vector<Segment> EncounterTranscript::getSegments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Segment> segments;
    for (const auto& window : windows_) {
        segments.insert(segments.end(), window.segments.begin(), window.segments.end());
    }
    return segments;
}

float EncounterTranscript::getConfidence() const {
    std::lock_guard<std::mutex> lock(mutex_);

    double weighted = 0.0;
    double totalDuration = 0.0;
    double plainSum = 0.0;
    size_t counted = 0;

    for (const auto& window : windows_) {
        if (window.empty()) {
            continue;
        }
        double duration = 0.0;
        for (const auto& segment : window.segments) {
            duration += segment.duration();
        }
        weighted += window.confidence * duration;
        totalDuration += duration;
        plainSum += window.confidence;
        counted++;
    }

    if (counted == 0) {
        return 0.0f;
    }
    if (totalDuration > 0.0) {
        return static_cast<float>(weighted / totalDuration);
    }
    return static_cast<float>(plainSum / static_cast<double>(counted));
}

void EncounterTranscript::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.clear();
}

} // namespace fusion
} // namespace clinscribe
