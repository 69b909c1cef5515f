#pragma once

#include "audio/audio_buffer.hpp"
#include "errors.hpp"
#include "platform/audio_capture.hpp"
#include "session_id.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

// Owns the capture device and the samples of the recording in progress.
// Runs entirely on the control thread.
class RecordingWorkflow {
public:
    RecordingWorkflow(AudioCapture& capture, uint32_t sample_rate, uint32_t max_seconds);

    // Opens the capture source. On failure nothing is held open.
    std::expected<void, DaemonError> start(SessionId owner);

    enum class Poll { Continue, LimitReached, DeviceLost };

    // Drains captured samples and reports whether the recording should end.
    Poll poll();

    // Closes capture and hands over everything recorded.
    AudioBuffer stop();

    // Closes capture and drops the samples.
    void discard();

    bool active() const { return active_; }
    std::optional<SessionId> owner() const { return owner_; }
    double duration() const;
    size_t samples() const { return samples_.size(); }

    void set_max_seconds(uint32_t max_seconds) { max_seconds_ = max_seconds; }

private:
    AudioCapture& capture_;
    uint32_t sample_rate_;
    uint32_t max_seconds_;
    bool active_ = false;
    std::optional<SessionId> owner_;
    std::vector<int16_t> samples_;
    std::chrono::steady_clock::time_point record_start_;
};
