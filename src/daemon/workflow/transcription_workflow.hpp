#pragma once

#include "audio/audio_buffer.hpp"
#include "speech/speech_engine.hpp"
#include "speech/voice_activity.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

struct TranscriptionOutcome {
    uint64_t job_id = 0;
    std::expected<std::string, std::string> result;
    double audio_s = 0.0;
    double processing_s = 0.0;
    size_t segments = 0;
    bool cancelled = false;
};

// Runs segment -> transcribe -> concatenate on a worker thread. Finished
// outcomes are queued for the control thread, which is woken through `notify`.
class TranscriptionWorkflow {
public:
    using NotifyCallback = std::function<void()>;

    explicit TranscriptionWorkflow(NotifyCallback notify);
    ~TranscriptionWorkflow();

    TranscriptionWorkflow(const TranscriptionWorkflow&) = delete;
    TranscriptionWorkflow& operator=(const TranscriptionWorkflow&) = delete;

    void submit(uint64_t job_id, AudioBuffer audio,
                std::shared_ptr<SpeechEngine> engine,
                std::shared_ptr<const VoiceActivityDetector> vad);

    // Requests cancellation and waits for the worker to exit.
    void cancel();

    std::vector<TranscriptionOutcome> take_completed();

    // The whole job, synchronously. A failed pass over the buffer is retried once.
    static TranscriptionOutcome run(uint64_t job_id, const AudioBuffer& audio,
                                    SpeechEngine& engine, const VoiceActivityDetector& vad,
                                    std::stop_token stop);

private:
    NotifyCallback notify_;
    std::mutex mutex_;
    std::vector<TranscriptionOutcome> completed_;
    std::jthread worker_;
};
