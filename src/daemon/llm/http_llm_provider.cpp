#include "llm/http_llm_provider.hpp"

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string translate_prompt(const std::string& target_lang) {
    return "You are an expert translator. Translate the following text into '" + target_lang +
           "'. Reply with the translated text only, without explanations or notes.";
}

} // namespace

HttpLlmProvider::HttpLlmProvider(Settings settings) : settings_(std::move(settings)) {}

std::string HttpLlmProvider::endpoint() const {
    std::string base = settings_.url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return settings_.api_format == "openai" ? base + "/v1/chat/completions" : base + "/api/chat";
}

json HttpLlmProvider::build_request_body(const Settings& settings, const RefineRequest& request) {
    const std::string system = request.mode == RefineRequest::Mode::Translate
        ? translate_prompt(request.target_lang)
        : settings.system_prompt;

    json messages = json::array({
        {{"role", "system"}, {"content", system}},
        {{"role", "user"}, {"content", request.text}},
    });

    json body = {{"model", settings.model}, {"messages", std::move(messages)}};
    if (settings.api_format == "openai") {
        body["temperature"] = settings.temperature;
        body["stream"] = false;
    } else {
        body["stream"] = false;
        body["options"] = {{"temperature", settings.temperature}};
    }
    return body;
}

std::expected<std::string, std::string>
HttpLlmProvider::parse_response(const std::string& api_format, const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>()
                                              : err.value("message", err.dump());
            return std::unexpected("llm error: " + msg);
        }

        std::string content;
        if (api_format == "openai") {
            if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
                return std::unexpected("unexpected response: no choices");
            }
            content = j["choices"][0].at("message").at("content").get<std::string>();
        } else {
            if (!j.contains("message")) {
                return std::unexpected("unexpected response: no message");
            }
            content = j["message"].at("content").get<std::string>();
        }

        content = trim(content);
        if (content.empty()) {
            return std::unexpected("llm returned empty text");
        }
        return content;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<std::string, std::string>
HttpLlmProvider::refine(const RefineRequest& request, std::stop_token stop) {
    std::vector<std::string> headers;
    if (!settings_.api_key.empty()) {
        headers.push_back("Authorization: Bearer " + settings_.api_key);
    }

    auto body = build_request_body(settings_, request).dump();
    auto resp = net::post_json(endpoint(), body, headers, settings_.timeout_ms, stop);
    if (!resp) {
        return std::unexpected(resp.error());
    }
    if (resp->status >= 400) {
        return std::unexpected("llm server returned HTTP " + std::to_string(resp->status));
    }
    return parse_response(settings_.api_format, resp->body);
}
