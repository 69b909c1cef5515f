#include "workflow/refinement_workflow.hpp"

#include <algorithm>
#include <condition_variable>
#include <print>
#include <utility>

std::chrono::milliseconds RetryPolicy::backoff_before(uint32_t attempt) const {
    if (attempt < 2) return std::chrono::milliseconds{0};
    auto delay = initial_backoff;
    for (uint32_t i = 2; i < attempt && delay < max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

namespace {

// Sleeps for `delay` unless stop is requested first. Returns false if stopped.
bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

} // namespace

RefinementWorkflow::RefinementWorkflow(NotifyCallback notify, bool verbose)
    : notify_(std::move(notify)), verbose_(verbose) {}

RefinementWorkflow::~RefinementWorkflow() {
    cancel();
}

RefinementOutcome RefinementWorkflow::run(uint64_t job_id, RefineRequest request,
                                          LlmProvider& provider, const RetryPolicy& policy,
                                          std::stop_token stop, bool verbose) {
    RefinementOutcome out;
    out.job_id = job_id;
    out.result = std::unexpected("not attempted");

    const uint32_t max_attempts = std::max<uint32_t>(1, policy.max_attempts);
    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            auto delay = policy.backoff_before(attempt);
            if (verbose) {
                std::println(stderr, "[v2m] refinement: attempt {}/{} failed: {} (retrying in {}ms)",
                             attempt - 1, max_attempts, out.result.error(), delay.count());
            }
            if (!interruptible_sleep(delay, stop)) break;
        }

        out.attempts = attempt;
        out.result = provider.refine(request, stop);
        if (out.result || stop.stop_requested()) break;
    }

    out.cancelled = stop.stop_requested();
    if (out.cancelled && !out.result) out.result = std::unexpected("cancelled");
    out.request = std::move(request);
    return out;
}

void RefinementWorkflow::submit(uint64_t job_id, RefineRequest request,
                                std::shared_ptr<LlmProvider> provider, RetryPolicy policy) {
    if (worker_.joinable()) {
        worker_.join();
    }

    worker_ = std::jthread([this, job_id, request = std::move(request),
                            provider = std::move(provider), policy]
                           (std::stop_token stop) mutable {
        auto outcome = run(job_id, std::move(request), *provider, policy, stop, verbose_);
        {
            std::lock_guard lock(mutex_);
            completed_.push_back(std::move(outcome));
        }
        notify_();
    });
}

void RefinementWorkflow::cancel() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

std::vector<RefinementOutcome> RefinementWorkflow::take_completed() {
    std::lock_guard lock(mutex_);
    return std::exchange(completed_, {});
}
