#pragma once

#include <cstdint>
#include <utility>
#include <vector>

// Captured mono PCM for one recording. Moved, never copied, between workflows.
struct AudioBuffer {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;

    AudioBuffer() = default;
    AudioBuffer(std::vector<int16_t> s, uint32_t rate) : samples(std::move(s)), sample_rate(rate) {}

    AudioBuffer(AudioBuffer&&) noexcept = default;
    AudioBuffer& operator=(AudioBuffer&&) noexcept = default;
    AudioBuffer(const AudioBuffer&) = delete;
    AudioBuffer& operator=(const AudioBuffer&) = delete;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
    bool empty() const { return samples.empty(); }
};
