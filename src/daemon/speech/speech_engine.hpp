#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <stop_token>
#include <string>

struct SegmentTranscript {
    std::string text;
    bool no_speech = false;   // engine judged the segment to contain no speech
};

// External speech recognizer. One instance is shared across jobs; transcribe()
// is only ever called from one worker at a time.
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::expected<SegmentTranscript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate, std::stop_token stop) = 0;
};
