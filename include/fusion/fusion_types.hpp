#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace clinscribe {
namespace fusion {

// Time-stamped span of text; times are seconds from the start of capture
struct Segment {
    std::string text;
    double start_time;
    double end_time;
    float confidence;

    Segment() : start_time(0.0), end_time(0.0), confidence(0.0f) {}
    Segment(const std::string& t, double start, double end, float conf)
        : text(t), start_time(start), end_time(end), confidence(conf) {}

    double duration() const { return end_time > start_time ? end_time - start_time : 0.0; }
};

// One provider's output for one audio window
struct TranscriptionCandidate {
    std::string provider_name;
    std::string text;
    std::vector<Segment> segments;
    float overall_confidence;
    bool domain_specialized;

    TranscriptionCandidate() : overall_confidence(0.0f), domain_specialized(false) {}
    TranscriptionCandidate(const std::string& provider, const std::string& t, float conf,
                           bool specialized = false)
        : provider_name(provider), text(t), overall_confidence(conf), domain_specialized(specialized) {}
};

// Merged result of one fusion pass. Segments are sorted by start time and
// never overlap.
struct FusedTranscript {
    std::string text;
    std::vector<Segment> segments;
    float confidence;
    std::vector<std::string> contributing_providers;

    FusedTranscript() : confidence(0.0f) {}

    bool empty() const { return text.empty() && segments.empty(); }
};

// Opaque unit of audio handed to every provider
struct AudioWindow {
    std::string window_id;
    std::vector<float> samples;
    int sample_rate;
    double start_time;
    double end_time;

    AudioWindow() : sample_rate(16000), start_time(0.0), end_time(0.0) {}
};

} // namespace fusion
} // namespace clinscribe
