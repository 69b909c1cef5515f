#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct Config {
    struct Transcription {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        long timeout_s = 120;
    } transcription;

    // Energy-based voice activity detection applied before transcription.
    struct Vad {
        double threshold = 0.015;   // frame RMS, normalized to [0, 1]
        uint32_t frame_ms = 30;
        uint32_t min_speech_ms = 250;
        uint32_t min_silence_ms = 500;
        uint32_t pad_ms = 200;
    } vad;

    struct Llm {
        std::string url = "http://localhost:11434";
        std::string api_format = "ollama"; // "ollama" or "openai"
        std::string model = "llama3.2";
        std::string api_key;
        std::string system_prompt =
            "You are an expert editor. Fix grammar, punctuation and coherence of the "
            "user's dictated text. Reply with the corrected text only.";
        double temperature = 0.3;
        long timeout_ms = 15000;
        uint32_t max_attempts = 3;
        uint32_t backoff_initial_ms = 500;
        uint32_t backoff_max_ms = 2000;
    } llm;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;

        static constexpr uint32_t MAX_SECONDS_LIMIT = 3600;
        static constexpr uint32_t MAX_SAMPLE_RATE = 192000;

        // Capture ring between the PipeWire thread and the 50 ms drain tick.
        // Independent of max_seconds; it only has to absorb a stalled tick.
        static constexpr uint32_t RING_SECONDS = 10;
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(RING_SECONDS) * sample_rate;
        }
    } audio;

    struct Ipc {
        static constexpr size_t MIN_FRAME_BYTES = 1024;

        size_t max_frame_bytes = 10 * 1024 * 1024;
        size_t queue_capacity = 64;

        // Largest PROCESS_TEXT/TRANSLATE_TEXT input. Leaves room in one frame
        // for the result event, which carries the text next to the refined one.
        size_t max_text_bytes() const { return max_frame_bytes / 4; }
    } ipc;

    struct Recording {
        // Any local client may stop a recording it did not start.
        bool allow_foreign_stop = true;
    } recording;

    static Config load(const std::string& path);
    static Config load_default();

    // Merges `updates` (same shape as the config file) into this config.
    // With strict set, unknown sections or keys are an error.
    std::expected<void, std::string> apply(const nlohmann::json& updates, bool strict = true);

    // Secrets are masked.
    nlohmann::json to_json() const;
};
