#pragma once

#include <expected>
#include <stop_token>
#include <string>

struct RefineRequest {
    enum class Mode { Refine, Translate };

    std::string text;
    Mode mode = Mode::Refine;
    std::string target_lang;    // Translate only
};

// External language model. Shared across refinement jobs, one call at a time.
class LlmProvider {
public:
    virtual ~LlmProvider() = default;
    virtual std::expected<std::string, std::string>
        refine(const RefineRequest& request, std::stop_token stop) = 0;
};
