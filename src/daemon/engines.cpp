#include "engines.hpp"

#include "llm/http_llm_provider.hpp"
#include "speech/energy_vad.hpp"
#include "speech/http_speech_engine.hpp"

std::expected<Engines, std::string> make_http_engines(const Config& config) {
    const auto& tc = config.transcription;
    if (tc.api_format != "whisper.cpp" && tc.api_format != "openai") {
        return std::unexpected("unknown transcription api_format: " + tc.api_format);
    }
    if (tc.url.empty()) {
        return std::unexpected("transcription url is empty");
    }

    const auto& lc = config.llm;
    if (lc.api_format != "ollama" && lc.api_format != "openai") {
        return std::unexpected("unknown llm api_format: " + lc.api_format);
    }

    Engines engines;
    engines.speech = std::make_shared<HttpSpeechEngine>(tc.url, tc.api_format, tc.language, tc.timeout_s);
    engines.vad = std::make_shared<EnergyVad>(EnergyVad::Params{
        .threshold = config.vad.threshold,
        .frame_ms = config.vad.frame_ms,
        .min_speech_ms = config.vad.min_speech_ms,
        .min_silence_ms = config.vad.min_silence_ms,
        .pad_ms = config.vad.pad_ms,
    });
    engines.llm = std::make_shared<HttpLlmProvider>(HttpLlmProvider::Settings{
        .url = lc.url,
        .api_format = lc.api_format,
        .model = lc.model,
        .api_key = lc.api_key,
        .system_prompt = lc.system_prompt,
        .temperature = lc.temperature,
        .timeout_ms = lc.timeout_ms,
    });
    return engines;
}
