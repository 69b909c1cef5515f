#pragma once

#include "broadcast_hub.hpp"
#include "command.hpp"
#include "config.hpp"
#include "daemon_state.hpp"
#include "engines.hpp"
#include "platform/audio_capture.hpp"
#include "session_registry.hpp"
#include "workflow/recording_workflow.hpp"
#include "workflow/refinement_workflow.hpp"
#include "workflow/transcription_workflow.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    // `notify` is called from worker threads when an outcome is ready; the
    // owner must then call on_worker_complete() on the control thread.
    DaemonCore(Config config, bool verbose,
               AudioCapture& audio, SessionRegistry& sessions,
               EngineFactory engine_factory, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // Decodes and executes one request. Returns the response for the
    // requesting session; state events are published to every session.
    nlohmann::json handle_message(SessionId session, std::string_view payload);
    nlohmann::json handle_command(const Command& cmd);

    void on_worker_complete();

    // Periodic control-thread tick: drains capture, enforces the duration limit.
    void on_tick();

    void on_session_closed(SessionId id);

    // SIGINT/SIGTERM path. Equivalent to SHUTDOWN without a response.
    void request_shutdown();
    bool shutdown_requested() const { return state_.phase() == Phase::ShuttingDown; }

    // Cancels workers and releases the capture device.
    void shutdown();

    const DaemonState& state() const { return state_.state(); }
    const Config& config() const { return config_; }
    const BroadcastHub& hub() const { return hub_; }

private:
    nlohmann::json handle_start(const Command& cmd);
    nlohmann::json handle_stop(const Command& cmd);
    nlohmann::json handle_toggle(const Command& cmd);
    nlohmann::json handle_status(const Command& cmd);
    nlohmann::json handle_refine(const Command& cmd, RefineRequest request);
    nlohmann::json handle_pause(const Command& cmd);
    nlohmann::json handle_resume(const Command& cmd);
    nlohmann::json handle_restart(const Command& cmd);
    nlohmann::json handle_shutdown(const Command& cmd);
    nlohmann::json handle_update_config(const Command& cmd);

    nlohmann::json reject(Trigger trigger);
    nlohmann::json fail(ErrorKind kind, std::string message);

    // Stops capture and hands the buffer to the transcription worker.
    double stop_and_transcribe();
    void cancel_workers();

    // Applies a transition that the caller has already checked.
    void transition(Trigger trigger, TransitionInput input = {});

    RetryPolicy retry_policy() const;

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    AudioCapture& audio_;
    SessionRegistry& sessions_;

    EngineFactory engine_factory_;
    Engines engines_;

    StateMachine state_;
    BroadcastHub hub_;

    RecordingWorkflow recording_;
    TranscriptionWorkflow transcription_;
    RefinementWorkflow refinement_;

    uint64_t next_job_ = 0;
    uint64_t transcription_job_ = 0;
    uint64_t refinement_job_ = 0;

    std::chrono::steady_clock::time_point started_;
};
