#pragma once

#include "errors.hpp"
#include "session_id.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class Phase {
    Idle,
    Recording,
    Transcribing,
    Processing,
    Paused,
    Error,
    Restarting,
    ShuttingDown,
};

enum class Trigger {
    StartRecording,
    StopRecording,
    TranscriptionDone,
    TranscriptionFailed,
    ProcessText,
    RefinementDone,
    RefinementFailed,
    Pause,
    Resume,
    Restart,
    RestartComplete,
    Shutdown,
    CaptureFailed,
};

std::string_view phase_name(Phase phase);
std::string_view trigger_name(Trigger trigger);

// The transition table. Returns the target phase, or std::nullopt if the
// trigger is not allowed from `from`.
std::optional<Phase> next_phase(Phase from, Trigger trigger);

struct DaemonState {
    Phase phase = Phase::Idle;
    std::optional<SessionId> owner;
    std::string transcript;
    std::optional<std::string> last_error;
    uint64_t sequence = 0;
};

nlohmann::json state_json(const DaemonState& state);

// What a transition carries besides the phase change.
struct TransitionInput {
    std::optional<SessionId> owner;         // StartRecording
    std::string transcript;                 // TranscriptionDone
    std::optional<DaemonError> error;       // *Failed, CaptureFailed
    nlohmann::json data = nullptr;          // forwarded to clients as event data
};

struct StateEvent {
    Phase from;
    Phase to;
    Trigger trigger;
    DaemonState snapshot;
    nlohmann::json data;
    std::optional<DaemonError> error;
};

// Owns the single DaemonState record. Only the control thread calls apply().
class StateMachine {
public:
    const DaemonState& state() const { return state_; }
    Phase phase() const { return state_.phase; }

    bool can(Trigger trigger) const { return next_phase(state_.phase, trigger).has_value(); }

    // The error a rejected trigger produces in the current phase.
    DaemonError rejection(Trigger trigger) const;

    std::expected<StateEvent, DaemonError> apply(Trigger trigger, TransitionInput input = {});

private:
    DaemonState state_;
};
