#pragma once

#include "config.hpp"
#include "llm/llm_provider.hpp"
#include "speech/speech_engine.hpp"
#include "speech/voice_activity.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <string>

// External collaborators shared across jobs. Rebuilt only while restarting.
struct Engines {
    std::shared_ptr<SpeechEngine> speech;
    std::shared_ptr<const VoiceActivityDetector> vad;
    std::shared_ptr<LlmProvider> llm;
};

using EngineFactory = std::function<std::expected<Engines, std::string>(const Config&)>;

// HttpSpeechEngine + EnergyVad + HttpLlmProvider from config.
std::expected<Engines, std::string> make_http_engines(const Config& config);
