#pragma once

#include <cstdint>
#include <span>
#include <vector>

// Encodes mono PCM int16 samples into an in-memory WAV file.
namespace wav {

inline constexpr size_t HEADER_SIZE = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + data_size);

    // Explicit little-endian so the output does not depend on host byte order.
    auto tag = [&out](const char (&t)[5]) { out.insert(out.end(), t, t + 4); };
    auto u16 = [&out](uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto u32 = [&out](uint32_t v) {
        for (int shift = 0; shift < 32; shift += 8) out.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    };

    tag("RIFF");
    u32(36 + data_size);
    tag("WAVE");
    tag("fmt ");
    u32(16);                                        // fmt chunk size
    u16(1);                                         // PCM
    u16(channels);
    u32(sample_rate);
    u32(sample_rate * channels * bits_per_sample / 8);
    u16(channels * bits_per_sample / 8);
    u16(bits_per_sample);
    tag("data");
    u32(data_size);
    for (int16_t s : samples) u16(static_cast<uint16_t>(s));

    return out;
}

} // namespace wav
