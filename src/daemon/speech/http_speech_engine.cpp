#include "speech/http_speech_engine.hpp"

#include "wav_encoder.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

HttpSpeechEngine::HttpSpeechEngine(std::string url, std::string api_format,
                                   std::string language, long timeout_s)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)), timeout_s_(timeout_s) {}

std::expected<SegmentTranscript, std::string>
HttpSpeechEngine::transcribe(std::span<const int16_t> audio, uint32_t sample_rate, std::stop_token stop) {
    if (audio.empty()) {
        return SegmentTranscript{.text = {}, .no_speech = true};
    }

    auto wav_data = wav::encode(audio, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    auto* file = curl_mime_addpart(mime);
    curl_mime_name(file, "file");
    curl_mime_data(file, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(file, "audio.wav");
    curl_mime_type(file, "audio/wav");
    add_field(mime, "response_format", "json");

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        add_field(mime, "model", "whisper-1");
        if (!language_.empty() && language_ != "auto") add_field(mime, "language", language_);
    } else {
        endpoint = url_ + "/inference";
        add_field(mime, "temperature", "0.0");
        if (!language_.empty()) add_field(mime, "language", language_);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, net::append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    net::abort_on_stop(curl, stop);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("cancelled");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        return std::unexpected("speech server returned HTTP " + std::to_string(status));
    }

    return parse_response(response_body);
}

std::expected<SegmentTranscript, std::string> HttpSpeechEngine::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>()
                                              : err.value("message", err.dump());
            return std::unexpected("server error: " + msg);
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + body);
        }

        SegmentTranscript out;
        out.text = trim(j["text"].get<std::string>());

        // verbose_json replies carry per-segment no-speech probabilities.
        if (j.contains("segments") && j["segments"].is_array() && !j["segments"].empty()) {
            bool all_silent = true;
            for (auto& seg : j["segments"]) {
                if (seg.value("no_speech_prob", 0.0) < 0.6) {
                    all_silent = false;
                    break;
                }
            }
            out.no_speech = all_silent;
        }
        return out;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
