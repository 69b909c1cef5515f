#pragma once

#include "net/curl_http.hpp"
#include "speech/speech_engine.hpp"

#include <string>

// Posts WAV segments to a whisper.cpp server (/inference) or an
// OpenAI-compatible endpoint (/v1/audio/transcriptions).
class HttpSpeechEngine : public SpeechEngine {
public:
    // api_format: "whisper.cpp" or "openai"
    HttpSpeechEngine(std::string url, std::string api_format = "whisper.cpp",
                     std::string language = "en", long timeout_s = 120);

    std::expected<SegmentTranscript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate, std::stop_token stop) override;

    // Extracts the transcript from a server reply.
    static std::expected<SegmentTranscript, std::string> parse_response(const std::string& body);

private:
    net::CurlGlobal curl_global_;
    std::string url_;
    std::string api_format_;
    std::string language_;
    long timeout_s_;
};
