#pragma once

#include "llm/llm_provider.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{2000};

    // Delay before attempt `attempt` (2-based): initial, doubled each time, capped.
    std::chrono::milliseconds backoff_before(uint32_t attempt) const;
};

struct RefinementOutcome {
    uint64_t job_id = 0;
    RefineRequest request;
    std::expected<std::string, std::string> result;
    uint32_t attempts = 0;
    bool cancelled = false;
};

// Calls the LLM provider on a worker thread with bounded retries.
class RefinementWorkflow {
public:
    using NotifyCallback = std::function<void()>;

    explicit RefinementWorkflow(NotifyCallback notify, bool verbose = false);
    ~RefinementWorkflow();

    RefinementWorkflow(const RefinementWorkflow&) = delete;
    RefinementWorkflow& operator=(const RefinementWorkflow&) = delete;

    void submit(uint64_t job_id, RefineRequest request,
                std::shared_ptr<LlmProvider> provider, RetryPolicy policy);

    void cancel();

    std::vector<RefinementOutcome> take_completed();

    // Retries are logged only when `verbose` is set.
    static RefinementOutcome run(uint64_t job_id, RefineRequest request,
                                 LlmProvider& provider, const RetryPolicy& policy,
                                 std::stop_token stop, bool verbose = false);

private:
    NotifyCallback notify_;
    bool verbose_;
    std::mutex mutex_;
    std::vector<RefinementOutcome> completed_;
    std::jthread worker_;
};
