#pragma once

#include "speech/voice_activity.hpp"

#include <cstdint>
#include <span>

// Frame-RMS voice activity detection. Frames above `threshold` count as
// speech; speech runs separated by less than min_silence are merged, runs
// shorter than min_speech are dropped, and each span is padded on both sides.
class EnergyVad : public VoiceActivityDetector {
public:
    struct Params {
        double threshold = 0.015;
        uint32_t frame_ms = 30;
        uint32_t min_speech_ms = 250;
        uint32_t min_silence_ms = 500;
        uint32_t pad_ms = 200;
    };

    explicit EnergyVad(Params params);

    std::vector<SpeechSpan> segment(const AudioBuffer& audio) const override;

    // RMS of a frame, normalized so full-scale square wave is 1.0.
    static double frame_rms(std::span<const int16_t> frame);

private:
    Params params_;
};
