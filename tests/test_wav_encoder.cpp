#include <catch2/catch_test_macros.hpp>

#include "wav_encoder.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace {

uint16_t le16(const std::vector<uint8_t>& b, size_t at) {
    return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
}

uint32_t le32(const std::vector<uint8_t>& b, size_t at) {
    return static_cast<uint32_t>(b[at]) | (static_cast<uint32_t>(b[at + 1]) << 8) |
           (static_cast<uint32_t>(b[at + 2]) << 16) | (static_cast<uint32_t>(b[at + 3]) << 24);
}

std::string tag(const std::vector<uint8_t>& b, size_t at) {
    return {reinterpret_cast<const char*>(b.data() + at), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("ChunkLayout") {
        auto wav = wav::encode(samples, rate);
        REQUIRE(wav.size() == wav::HEADER_SIZE + samples.size() * 2);
        REQUIRE(tag(wav, 0) == "RIFF");
        REQUIRE(tag(wav, 8) == "WAVE");
        REQUIRE(tag(wav, 12) == "fmt ");
        REQUIRE(tag(wav, 36) == "data");
    }

    SECTION("FormatChunk") {
        auto wav = wav::encode(samples, 48000);
        REQUIRE(le32(wav, 16) == 16);          // fmt chunk size
        REQUIRE(le16(wav, 20) == 1);           // PCM
        REQUIRE(le16(wav, 22) == 1);           // mono
        REQUIRE(le32(wav, 24) == 48000);
        REQUIRE(le32(wav, 28) == 48000 * 2);   // byte rate
        REQUIRE(le16(wav, 32) == 2);           // block align
        REQUIRE(le16(wav, 34) == 16);
    }

    SECTION("Sizes") {
        auto wav = wav::encode(samples, rate);
        REQUIRE(le32(wav, 40) == 10);
        REQUIRE(le32(wav, 4) == 36 + 10);
    }

    SECTION("SamplesLittleEndian") {
        auto wav = wav::encode(samples, rate);
        REQUIRE(le16(wav, 44 + 2) == 100);
        REQUIRE(static_cast<int16_t>(le16(wav, 44 + 4)) == -100);
        REQUIRE(wav[44 + 6] == 0xFF);
        REQUIRE(wav[44 + 7] == 0x7F);
        REQUIRE(wav[44 + 8] == 0x00);
        REQUIRE(wav[44 + 9] == 0x80);
    }

    SECTION("SubspanOfRecording") {
        std::vector<int16_t> recording(1000, 3);
        auto wav = wav::encode(std::span<const int16_t>(recording).subspan(100, 250), rate);
        REQUIRE(wav.size() == wav::HEADER_SIZE + 500);
        REQUIRE(le32(wav, 40) == 500);
    }

    SECTION("EmptySamples") {
        auto wav = wav::encode({}, rate);
        REQUIRE(wav.size() == wav::HEADER_SIZE);
        REQUIRE(le32(wav, 40) == 0);
    }
}
