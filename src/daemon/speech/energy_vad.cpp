#include "speech/energy_vad.hpp"

#include <algorithm>
#include <cmath>

namespace {

size_t ms_to_samples(uint32_t ms, uint32_t rate) {
    return static_cast<size_t>(ms) * rate / 1000;
}

} // namespace

EnergyVad::EnergyVad(Params params) : params_(params) {
    if (params_.frame_ms == 0) params_.frame_ms = 30;
}

double EnergyVad::frame_rms(std::span<const int16_t> frame) {
    if (frame.empty()) return 0.0;
    double sum = 0.0;
    for (int16_t s : frame) {
        double v = s / 32768.0;
        sum += v * v;
    }
    return std::sqrt(sum / static_cast<double>(frame.size()));
}

std::vector<SpeechSpan> EnergyVad::segment(const AudioBuffer& audio) const {
    std::vector<SpeechSpan> spans;
    const size_t total = audio.samples.size();
    if (total == 0 || audio.sample_rate == 0) return spans;

    const size_t frame = std::max<size_t>(1, ms_to_samples(params_.frame_ms, audio.sample_rate));
    const size_t min_speech = ms_to_samples(params_.min_speech_ms, audio.sample_rate);
    const size_t min_silence = ms_to_samples(params_.min_silence_ms, audio.sample_rate);
    const size_t pad = ms_to_samples(params_.pad_ms, audio.sample_rate);

    std::span<const int16_t> all(audio.samples);

    // Raw runs of loud frames.
    std::vector<SpeechSpan> raw;
    for (size_t pos = 0; pos < total; pos += frame) {
        size_t len = std::min(frame, total - pos);
        bool speech = frame_rms(all.subspan(pos, len)) >= params_.threshold;
        if (!speech) continue;
        if (!raw.empty() && raw.back().end == pos) {
            raw.back().end = pos + len;
        } else {
            raw.push_back({pos, pos + len});
        }
    }

    // Bridge short pauses.
    for (auto& run : raw) {
        if (!spans.empty() && run.begin - spans.back().end < min_silence) {
            spans.back().end = run.end;
        } else {
            spans.push_back(run);
        }
    }

    std::erase_if(spans, [&](const SpeechSpan& s) { return s.length() < min_speech; });

    for (auto& s : spans) {
        s.begin = s.begin > pad ? s.begin - pad : 0;
        s.end = std::min(total, s.end + pad);
    }

    // Padding may make neighbours touch.
    std::vector<SpeechSpan> merged;
    for (auto& s : spans) {
        if (!merged.empty() && s.begin <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, s.end);
        } else {
            merged.push_back(s);
        }
    }
    return merged;
}
