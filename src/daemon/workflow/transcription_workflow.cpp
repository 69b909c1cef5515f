#include "workflow/transcription_workflow.hpp"

#include "speech/transcript_filter.hpp"

#include <chrono>
#include <print>
#include <utility>

namespace {

constexpr int MAX_PASSES = 2;

// One pass over all speech spans.
std::expected<std::string, std::string>
transcribe_spans(const AudioBuffer& audio, const std::vector<SpeechSpan>& spans,
                 SpeechEngine& engine, std::stop_token stop) {
    std::span<const int16_t> all(audio.samples);
    std::string text;

    for (const auto& span : spans) {
        if (stop.stop_requested()) {
            return std::unexpected("cancelled");
        }
        auto res = engine.transcribe(all.subspan(span.begin, span.length()), audio.sample_rate, stop);
        if (!res) {
            return std::unexpected(res.error());
        }
        if (res->no_speech) continue;
        transcript::append(text, transcript::clean(res->text));
    }
    return text;
}

} // namespace

TranscriptionWorkflow::TranscriptionWorkflow(NotifyCallback notify)
    : notify_(std::move(notify)) {}

TranscriptionWorkflow::~TranscriptionWorkflow() {
    cancel();
}

TranscriptionOutcome TranscriptionWorkflow::run(uint64_t job_id, const AudioBuffer& audio,
                                                SpeechEngine& engine,
                                                const VoiceActivityDetector& vad,
                                                std::stop_token stop) {
    auto t0 = std::chrono::steady_clock::now();

    TranscriptionOutcome out;
    out.job_id = job_id;
    out.audio_s = audio.duration_s();

    auto spans = vad.segment(audio);
    out.segments = spans.size();

    if (spans.empty()) {
        out.result = std::string{};
    } else {
        for (int pass = 1; pass <= MAX_PASSES; ++pass) {
            out.result = transcribe_spans(audio, spans, engine, stop);
            if (out.result || stop.stop_requested()) break;
            if (pass < MAX_PASSES) {
                std::println(stderr, "transcription: {} (retrying)", out.result.error());
            }
        }
    }

    out.cancelled = stop.stop_requested();
    out.processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    return out;
}

void TranscriptionWorkflow::submit(uint64_t job_id, AudioBuffer audio,
                                   std::shared_ptr<SpeechEngine> engine,
                                   std::shared_ptr<const VoiceActivityDetector> vad) {
    if (worker_.joinable()) {
        worker_.join();
    }

    worker_ = std::jthread([this, job_id, audio = std::move(audio),
                            engine = std::move(engine), vad = std::move(vad)]
                           (std::stop_token stop) {
        auto outcome = run(job_id, audio, *engine, *vad, stop);
        {
            std::lock_guard lock(mutex_);
            completed_.push_back(std::move(outcome));
        }
        notify_();
    });
}

void TranscriptionWorkflow::cancel() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

std::vector<TranscriptionOutcome> TranscriptionWorkflow::take_completed() {
    std::lock_guard lock(mutex_);
    return std::exchange(completed_, {});
}
