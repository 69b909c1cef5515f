#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <print>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* MASKED = "********";

// Copies j[key] into out when present. Records unknown keys for strict mode.
struct Section {
    const json& j;
    std::string name;
    std::vector<std::string>& unknown;
    std::vector<std::string> seen;

    template <typename T>
    void get(const char* key, T& out) {
        seen.emplace_back(key);
        if (j.contains(key)) out = j.at(key).get<T>();
    }

    void finish() {
        for (auto& [key, value] : j.items()) {
            if (std::ranges::find(seen, key) == seen.end()) {
                unknown.push_back(name + "." + key);
            }
        }
    }
};

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);
        Config loaded;
        if (auto res = loaded.apply(j, false); !res) {
            std::println(stderr, "config: {}, using defaults", res.error());
            return cfg;
        }
        cfg = std::move(loaded);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::expected<void, std::string> Config::apply(const json& updates, bool strict) {
    if (!updates.is_object()) {
        return std::unexpected("config updates must be a JSON object");
    }

    Config next = *this;
    std::vector<std::string> unknown;

    try {
        for (auto& [name, body] : updates.items()) {
            if (!body.is_object()) {
                unknown.push_back(name);
                continue;
            }
            Section s{body, name, unknown, {}};

            if (name == "transcription") {
                s.get("url", next.transcription.url);
                s.get("api_format", next.transcription.api_format);
                s.get("language", next.transcription.language);
                s.get("timeout_s", next.transcription.timeout_s);
            } else if (name == "vad") {
                s.get("threshold", next.vad.threshold);
                s.get("frame_ms", next.vad.frame_ms);
                s.get("min_speech_ms", next.vad.min_speech_ms);
                s.get("min_silence_ms", next.vad.min_silence_ms);
                s.get("pad_ms", next.vad.pad_ms);
            } else if (name == "llm") {
                s.get("url", next.llm.url);
                s.get("api_format", next.llm.api_format);
                s.get("model", next.llm.model);
                s.get("system_prompt", next.llm.system_prompt);
                s.get("temperature", next.llm.temperature);
                s.get("timeout_ms", next.llm.timeout_ms);
                s.get("max_attempts", next.llm.max_attempts);
                s.get("backoff_initial_ms", next.llm.backoff_initial_ms);
                s.get("backoff_max_ms", next.llm.backoff_max_ms);
                // A masked key echoed back from GET_CONFIG leaves the secret as is.
                std::string key = next.llm.api_key;
                s.get("api_key", key);
                if (key != MASKED) next.llm.api_key = key;
            } else if (name == "audio") {
                s.get("sample_rate", next.audio.sample_rate);
                s.get("max_seconds", next.audio.max_seconds);
            } else if (name == "ipc") {
                s.get("max_frame_bytes", next.ipc.max_frame_bytes);
                s.get("queue_capacity", next.ipc.queue_capacity);
            } else if (name == "recording") {
                s.get("allow_foreign_stop", next.recording.allow_foreign_stop);
            } else {
                unknown.push_back(name);
                continue;
            }
            s.finish();
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::format("invalid config value: {}", e.what()));
    }

    if (strict && !unknown.empty()) {
        std::string keys;
        for (auto& k : unknown) keys += (keys.empty() ? "" : ", ") + k;
        return std::unexpected("unknown config keys: " + keys);
    }
    if (next.llm.max_attempts == 0) {
        return std::unexpected("llm.max_attempts must be at least 1");
    }
    if (next.llm.timeout_ms <= 0) {
        return std::unexpected("llm.timeout_ms must be positive");
    }
    if (next.transcription.timeout_s <= 0) {
        return std::unexpected("transcription.timeout_s must be positive");
    }
    if (next.audio.sample_rate == 0 || next.audio.sample_rate > Audio::MAX_SAMPLE_RATE) {
        return std::unexpected(std::format("audio.sample_rate must be between 1 and {}",
                                           Audio::MAX_SAMPLE_RATE));
    }
    if (next.audio.max_seconds == 0 || next.audio.max_seconds > Audio::MAX_SECONDS_LIMIT) {
        return std::unexpected(std::format("audio.max_seconds must be between 1 and {}",
                                           Audio::MAX_SECONDS_LIMIT));
    }
    if (next.ipc.max_frame_bytes < Ipc::MIN_FRAME_BYTES ||
        next.ipc.max_frame_bytes > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected(std::format("ipc.max_frame_bytes must be between {} and {}",
                                           Ipc::MIN_FRAME_BYTES, std::numeric_limits<uint32_t>::max()));
    }
    if (next.ipc.queue_capacity == 0) {
        return std::unexpected("ipc.queue_capacity must be at least 1");
    }

    *this = std::move(next);
    return {};
}

json Config::to_json() const {
    return {
        {"transcription", {
            {"url", transcription.url},
            {"api_format", transcription.api_format},
            {"language", transcription.language},
            {"timeout_s", transcription.timeout_s},
        }},
        {"vad", {
            {"threshold", vad.threshold},
            {"frame_ms", vad.frame_ms},
            {"min_speech_ms", vad.min_speech_ms},
            {"min_silence_ms", vad.min_silence_ms},
            {"pad_ms", vad.pad_ms},
        }},
        {"llm", {
            {"url", llm.url},
            {"api_format", llm.api_format},
            {"model", llm.model},
            {"api_key", llm.api_key.empty() ? "" : MASKED},
            {"system_prompt", llm.system_prompt},
            {"temperature", llm.temperature},
            {"timeout_ms", llm.timeout_ms},
            {"max_attempts", llm.max_attempts},
            {"backoff_initial_ms", llm.backoff_initial_ms},
            {"backoff_max_ms", llm.backoff_max_ms},
        }},
        {"audio", {
            {"sample_rate", audio.sample_rate},
            {"max_seconds", audio.max_seconds},
        }},
        {"ipc", {
            {"max_frame_bytes", ipc.max_frame_bytes},
            {"queue_capacity", ipc.queue_capacity},
        }},
        {"recording", {
            {"allow_foreign_stop", recording.allow_foreign_stop},
        }},
    };
}
