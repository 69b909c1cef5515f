#pragma once

#include "llm/llm_provider.hpp"
#include "net/curl_http.hpp"

#include <nlohmann/json.hpp>

// Chat-completion client for Ollama (/api/chat) or any OpenAI-compatible
// server (/v1/chat/completions).
class HttpLlmProvider : public LlmProvider {
public:
    struct Settings {
        std::string url;
        std::string api_format = "ollama";  // "ollama" or "openai"
        std::string model;
        std::string api_key;
        std::string system_prompt;
        double temperature = 0.3;
        long timeout_ms = 15000;
    };

    explicit HttpLlmProvider(Settings settings);

    std::expected<std::string, std::string>
        refine(const RefineRequest& request, std::stop_token stop) override;

    std::string endpoint() const;

    static nlohmann::json build_request_body(const Settings& settings, const RefineRequest& request);
    static std::expected<std::string, std::string>
        parse_response(const std::string& api_format, const std::string& body);

private:
    net::CurlGlobal curl_global_;
    Settings settings_;
};
