#pragma once

#include "audio/audio_buffer.hpp"

#include <cstddef>
#include <vector>

// Half-open range of sample indices [begin, end) containing speech.
struct SpeechSpan {
    size_t begin = 0;
    size_t end = 0;

    size_t length() const { return end - begin; }
    bool operator==(const SpeechSpan&) const = default;
};

class VoiceActivityDetector {
public:
    virtual ~VoiceActivityDetector() = default;
    // Spans are sorted, non-overlapping and inside the buffer.
    virtual std::vector<SpeechSpan> segment(const AudioBuffer& audio) const = 0;
};
