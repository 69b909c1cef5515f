#include "daemon_core.hpp"

#include "protocol/messages.hpp"

#include <format>
#include <print>
#include <utility>
#include <vector>

using json = nlohmann::json;

DaemonCore::DaemonCore(Config config, bool verbose,
                       AudioCapture& audio, SessionRegistry& sessions,
                       EngineFactory engine_factory, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      audio_(audio), sessions_(sessions),
      engine_factory_(std::move(engine_factory)),
      hub_(sessions_, config_.ipc.max_frame_bytes, verbose_),
      recording_(audio_, config_.audio.sample_rate, config_.audio.max_seconds),
      transcription_(notify),
      refinement_(notify, verbose_),
      started_(std::chrono::steady_clock::now()) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    auto engines = engine_factory_(config_);
    if (!engines) {
        std::println(stderr, "Failed to create engines: {}", engines.error());
        return false;
    }
    engines_ = std::move(*engines);
    started_ = std::chrono::steady_clock::now();
    return true;
}

json DaemonCore::handle_message(SessionId session, std::string_view payload) {
    auto cmd = parse_command(session, payload);
    if (!cmd) {
        log(std::format("Rejected request from session {}: {}", session, cmd.error().message));
        return messages::failure(state(), cmd.error());
    }
    return handle_command(*cmd);
}

json DaemonCore::handle_command(const Command& cmd) {
    switch (cmd.kind) {
        case CommandKind::StartRecording: return handle_start(cmd);
        case CommandKind::StopRecording: return handle_stop(cmd);
        case CommandKind::ToggleRecording: return handle_toggle(cmd);
        case CommandKind::GetStatus: return handle_status(cmd);
        case CommandKind::ProcessText:
            return handle_refine(cmd, RefineRequest{
                .text = std::get<TextPayload>(cmd.payload).text,
                .mode = RefineRequest::Mode::Refine,
            });
        case CommandKind::TranslateText: {
            const auto& p = std::get<TranslatePayload>(cmd.payload);
            return handle_refine(cmd, RefineRequest{
                .text = p.text,
                .mode = RefineRequest::Mode::Translate,
                .target_lang = p.target_lang,
            });
        }
        case CommandKind::Pause: return handle_pause(cmd);
        case CommandKind::Resume: return handle_resume(cmd);
        case CommandKind::Restart: return handle_restart(cmd);
        case CommandKind::Shutdown: return handle_shutdown(cmd);
        case CommandKind::Ping: return messages::success(state(), {{"message", "PONG"}});
        case CommandKind::GetConfig: return messages::success(state(), config_.to_json());
        case CommandKind::UpdateConfig: return handle_update_config(cmd);
    }
    return fail(ErrorKind::Protocol, "unknown command");
}

json DaemonCore::handle_start(const Command& cmd) {
    if (!state_.can(Trigger::StartRecording)) {
        return reject(Trigger::StartRecording);
    }

    if (auto res = recording_.start(cmd.session); !res) {
        if (state_.phase() == Phase::Error) {
            transition(Trigger::CaptureFailed, {.error = res.error()});
        }
        return messages::failure(state(), res.error());
    }

    transition(Trigger::StartRecording, {.owner = cmd.session, .data = {{"session", cmd.session}}});
    log(std::format("Recording started by session {}", cmd.session));
    return messages::success(state(), {{"message", "recording"}});
}

json DaemonCore::handle_stop(const Command& cmd) {
    if (!state_.can(Trigger::StopRecording)) {
        return reject(Trigger::StopRecording);
    }

    auto owner = recording_.owner();
    if (!config_.recording.allow_foreign_stop && owner && *owner != cmd.session &&
        sessions_.contains(*owner)) {
        return fail(ErrorKind::StateConflict,
                    std::format("recording is owned by session {}", *owner));
    }

    double duration = stop_and_transcribe();
    return messages::success(state(), {{"message", "transcribing"}, {"duration", duration}});
}

json DaemonCore::handle_toggle(const Command& cmd) {
    if (state_.phase() == Phase::Recording) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

json DaemonCore::handle_status(const Command& /*cmd*/) {
    const auto& s = state();
    auto uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

    json data = {
        {"phase", phase_name(s.phase)},
        {"sequence", s.sequence},
        {"recording", recording_.active()},
        {"duration", recording_.duration()},
        {"uptime", uptime},
        {"sessions", sessions_.size()},
    };
    return messages::success(s, std::move(data));
}

json DaemonCore::handle_refine(const Command& cmd, RefineRequest request) {
    if (!state_.can(Trigger::ProcessText)) {
        return reject(Trigger::ProcessText);
    }
    if (request.text.size() > config_.ipc.max_text_bytes()) {
        return fail(ErrorKind::Protocol,
                    std::format("text is {} bytes, the limit is {} bytes",
                                request.text.size(), config_.ipc.max_text_bytes()));
    }

    bool translate = request.mode == RefineRequest::Mode::Translate;
    json data = {{"mode", translate ? "translate" : "refine"}, {"session", cmd.session}};
    if (translate) data["target_lang"] = request.target_lang;

    transition(Trigger::ProcessText, {.data = std::move(data)});
    log(std::format("Refining {} chars for session {}", request.text.size(), cmd.session));

    refinement_job_ = ++next_job_;
    refinement_.submit(refinement_job_, std::move(request), engines_.llm, retry_policy());
    return messages::success(state(), {{"message", "processing"}});
}

json DaemonCore::handle_pause(const Command& /*cmd*/) {
    if (!state_.can(Trigger::Pause)) {
        return reject(Trigger::Pause);
    }

    cancel_workers();
    bool discarded = recording_.active();
    recording_.discard();

    transition(Trigger::Pause, {.data = {{"discarded_recording", discarded}}});
    return messages::success(state(), {{"message", "paused"}});
}

json DaemonCore::handle_resume(const Command& /*cmd*/) {
    if (!state_.can(Trigger::Resume)) {
        return reject(Trigger::Resume);
    }
    transition(Trigger::Resume);
    return messages::success(state(), {{"message", "resumed"}});
}

json DaemonCore::handle_restart(const Command& /*cmd*/) {
    if (!state_.can(Trigger::Restart)) {
        return reject(Trigger::Restart);
    }

    transition(Trigger::Restart);
    cancel_workers();
    recording_.discard();

    bool rebuilt = true;
    if (auto fresh = engine_factory_(config_); fresh) {
        engines_ = std::move(*fresh);
    } else {
        rebuilt = false;
        std::println(stderr, "core: engine rebuild failed, keeping previous engines: {}", fresh.error());
    }

    transition(Trigger::RestartComplete, {.data = {{"engines_rebuilt", rebuilt}}});
    return messages::success(state(), {{"message", "restarted"}, {"engines_rebuilt", rebuilt}});
}

json DaemonCore::handle_shutdown(const Command& cmd) {
    if (!state_.can(Trigger::Shutdown)) {
        return reject(Trigger::Shutdown);
    }
    log(std::format("Shutdown requested by session {}", cmd.session));
    request_shutdown();
    return messages::success(state(), {{"message", "shutting down"}});
}

json DaemonCore::handle_update_config(const Command& cmd) {
    if (state_.phase() != Phase::Idle) {
        return fail(ErrorKind::StateConflict,
                    std::format("configuration can only be changed while idle (daemon is {})",
                                phase_name(state_.phase())));
    }

    const auto& updates = std::get<ConfigUpdatePayload>(cmd.payload).updates;
    Config next = config_;
    if (auto res = next.apply(updates); !res) {
        return fail(ErrorKind::Protocol, res.error());
    }

    // Capture format and transport limits are fixed for the life of the
    // process. Echoing the current value back is accepted.
    std::vector<std::string> fixed;
    if (next.audio.sample_rate != config_.audio.sample_rate) fixed.emplace_back("audio.sample_rate");
    if (next.ipc.max_frame_bytes != config_.ipc.max_frame_bytes) fixed.emplace_back("ipc.max_frame_bytes");
    if (next.ipc.queue_capacity != config_.ipc.queue_capacity) fixed.emplace_back("ipc.queue_capacity");
    if (!fixed.empty()) {
        std::string keys;
        for (auto& k : fixed) keys += (keys.empty() ? "" : ", ") + k;
        return fail(ErrorKind::Protocol,
                    std::format("read-only at runtime, edit the config file and restart the daemon: {}", keys));
    }

    config_ = std::move(next);
    recording_.set_max_seconds(config_.audio.max_seconds);

    // Engines pick up transcription/vad/llm changes on the next RESTART.
    bool restart_required = updates.contains("transcription") || updates.contains("vad") ||
                            updates.contains("llm");
    log("Configuration updated");
    return messages::success(state(), {{"config", config_.to_json()},
                                       {"restart_required", restart_required}});
}

void DaemonCore::on_worker_complete() {
    for (auto& out : transcription_.take_completed()) {
        if (out.job_id != transcription_job_ || state_.phase() != Phase::Transcribing) {
            log(std::format("Ignoring stale transcription result (job {})", out.job_id));
            continue;
        }
        transcription_job_ = 0;

        if (out.result) {
            log(std::format("Transcription complete: {:.1f}s audio, {} segments, {:.1f}s processing, {} chars",
                            out.audio_s, out.segments, out.processing_s, out.result->size()));
            json data = {
                {"text", *out.result},
                {"audio_duration", out.audio_s},
                {"processing_time", out.processing_s},
                {"segments", out.segments},
            };
            transition(Trigger::TranscriptionDone, {.transcript = *out.result, .data = std::move(data)});
        } else {
            std::println(stderr, "transcription: failed: {}", out.result.error());
            transition(Trigger::TranscriptionFailed,
                       {.error = DaemonError{ErrorKind::Transcription, out.result.error()}});
        }
    }

    for (auto& out : refinement_.take_completed()) {
        if (out.job_id != refinement_job_ || state_.phase() != Phase::Processing) {
            log(std::format("Ignoring stale refinement result (job {})", out.job_id));
            continue;
        }
        refinement_job_ = 0;

        bool translate = out.request.mode == RefineRequest::Mode::Translate;
        if (out.result) {
            log(std::format("Refinement complete after {} attempt(s)", out.attempts));
            json data = {
                {"text", *out.result},
                {"original", out.request.text},
                {"mode", translate ? "translate" : "refine"},
            };
            transition(Trigger::RefinementDone, {.data = std::move(data)});
        } else {
            auto msg = std::format("refinement failed after {} attempt(s): {}", out.attempts, out.result.error());
            std::println(stderr, "refinement: {}", msg);
            transition(Trigger::RefinementFailed, {
                .error = DaemonError{ErrorKind::Refinement, msg},
                .data = {{"text", out.request.text}},
            });
        }
    }
}

void DaemonCore::on_tick() {
    if (!recording_.active()) return;

    switch (recording_.poll()) {
        case RecordingWorkflow::Poll::Continue:
            break;
        case RecordingWorkflow::Poll::LimitReached:
            log(std::format("Recording reached the {}s limit, stopping", config_.audio.max_seconds));
            stop_and_transcribe();
            break;
        case RecordingWorkflow::Poll::DeviceLost:
            std::println(stderr, "recording: capture device failed, discarding recording");
            recording_.discard();
            transition(Trigger::CaptureFailed,
                       {.error = DaemonError{ErrorKind::AudioDevice, "capture device failed during recording"}});
            break;
    }
}

void DaemonCore::on_session_closed(SessionId id) {
    if (recording_.active() && recording_.owner() == id) {
        log(std::format("Recording owner (session {}) disconnected", id));
    }
}

void DaemonCore::request_shutdown() {
    if (state_.phase() == Phase::ShuttingDown) return;
    transition(Trigger::Shutdown);
    cancel_workers();
    recording_.discard();
}

void DaemonCore::shutdown() {
    cancel_workers();
    recording_.discard();
}

json DaemonCore::reject(Trigger trigger) {
    auto err = state_.rejection(trigger);
    log(std::format("Rejected {}: {}", trigger_name(trigger), err.message));
    return messages::failure(state(), err);
}

json DaemonCore::fail(ErrorKind kind, std::string message) {
    log("Request failed: " + message);
    return messages::failure(state(), DaemonError{kind, std::move(message)});
}

double DaemonCore::stop_and_transcribe() {
    auto audio = recording_.stop();
    double duration = audio.duration_s();
    log(std::format("Recording stopped, {:.1f}s audio, transcribing...", duration));

    transition(Trigger::StopRecording, {.data = {{"duration", duration}}});

    transcription_job_ = ++next_job_;
    transcription_.submit(transcription_job_, std::move(audio), engines_.speech, engines_.vad);
    return duration;
}

void DaemonCore::cancel_workers() {
    transcription_.cancel();
    refinement_.cancel();
    transcription_job_ = 0;
    refinement_job_ = 0;
}

void DaemonCore::transition(Trigger trigger, TransitionInput input) {
    auto ev = state_.apply(trigger, std::move(input));
    if (!ev) {
        std::println(stderr, "core: cannot {}: {}", trigger_name(trigger), ev.error().message);
        return;
    }
    log(std::format("{} -> {} (#{})", phase_name(ev->from), phase_name(ev->to), ev->snapshot.sequence));
    hub_.publish(*ev);
}

RetryPolicy DaemonCore::retry_policy() const {
    return RetryPolicy{
        .max_attempts = config_.llm.max_attempts,
        .initial_backoff = std::chrono::milliseconds(config_.llm.backoff_initial_ms),
        .max_backoff = std::chrono::milliseconds(config_.llm.backoff_max_ms),
    };
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[v2m] {}", msg);
    }
}
