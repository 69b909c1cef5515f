#include "workflow/recording_workflow.hpp"

#include <print>
#include <utility>

RecordingWorkflow::RecordingWorkflow(AudioCapture& capture, uint32_t sample_rate, uint32_t max_seconds)
    : capture_(capture), sample_rate_(sample_rate), max_seconds_(max_seconds) {}

std::expected<void, DaemonError> RecordingWorkflow::start(SessionId owner) {
    if (active_) {
        return std::unexpected(DaemonError{ErrorKind::StateConflict, "already recording"});
    }

    samples_.clear();
    if (auto res = capture_.open(); !res) {
        std::println(stderr, "recording: failed to open capture: {}", res.error());
        capture_.close();
        return std::unexpected(DaemonError{ErrorKind::AudioDevice, res.error()});
    }

    samples_.reserve(static_cast<size_t>(sample_rate_) * 10);
    owner_ = owner;
    record_start_ = std::chrono::steady_clock::now();
    active_ = true;
    return {};
}

RecordingWorkflow::Poll RecordingWorkflow::poll() {
    if (!active_) return Poll::Continue;
    capture_.read(samples_);
    if (capture_.failed()) return Poll::DeviceLost;

    size_t limit = static_cast<size_t>(max_seconds_) * sample_rate_;
    if (limit > 0 && samples_.size() >= limit) return Poll::LimitReached;
    return Poll::Continue;
}

AudioBuffer RecordingWorkflow::stop() {
    if (!active_) return {};

    capture_.read(samples_);
    capture_.close();

    size_t limit = static_cast<size_t>(max_seconds_) * sample_rate_;
    if (limit > 0 && samples_.size() > limit) samples_.resize(limit);

    active_ = false;
    owner_.reset();
    return AudioBuffer(std::exchange(samples_, {}), sample_rate_);
}

void RecordingWorkflow::discard() {
    if (capture_.is_open()) capture_.close();
    active_ = false;
    owner_.reset();
    samples_.clear();
    samples_.shrink_to_fit();
}

double RecordingWorkflow::duration() const {
    if (!active_) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}
