#include "daemon_state.hpp"

#include <format>

std::string_view phase_name(Phase phase) {
    switch (phase) {
        case Phase::Idle: return "idle";
        case Phase::Recording: return "recording";
        case Phase::Transcribing: return "transcribing";
        case Phase::Processing: return "processing";
        case Phase::Paused: return "paused";
        case Phase::Error: return "error";
        case Phase::Restarting: return "restarting";
        case Phase::ShuttingDown: return "shutting_down";
    }
    return "unknown";
}

std::string_view trigger_name(Trigger trigger) {
    switch (trigger) {
        case Trigger::StartRecording: return "start recording";
        case Trigger::StopRecording: return "stop recording";
        case Trigger::TranscriptionDone: return "complete transcription";
        case Trigger::TranscriptionFailed: return "fail transcription";
        case Trigger::ProcessText: return "process text";
        case Trigger::RefinementDone: return "complete refinement";
        case Trigger::RefinementFailed: return "fail refinement";
        case Trigger::Pause: return "pause";
        case Trigger::Resume: return "resume";
        case Trigger::Restart: return "restart";
        case Trigger::RestartComplete: return "complete restart";
        case Trigger::Shutdown: return "shut down";
        case Trigger::CaptureFailed: return "drop capture";
    }
    return "unknown";
}

std::optional<Phase> next_phase(Phase from, Trigger trigger) {
    if (from == Phase::ShuttingDown) return std::nullopt;

    switch (trigger) {
        case Trigger::StartRecording:
            if (from == Phase::Idle || from == Phase::Error) return Phase::Recording;
            break;
        case Trigger::StopRecording:
            if (from == Phase::Recording) return Phase::Transcribing;
            break;
        case Trigger::TranscriptionDone:
            if (from == Phase::Transcribing) return Phase::Idle;
            break;
        case Trigger::TranscriptionFailed:
            if (from == Phase::Transcribing) return Phase::Error;
            break;
        case Trigger::ProcessText:
            if (from == Phase::Idle || from == Phase::Error) return Phase::Processing;
            break;
        case Trigger::RefinementDone:
            if (from == Phase::Processing) return Phase::Idle;
            break;
        case Trigger::RefinementFailed:
            if (from == Phase::Processing) return Phase::Error;
            break;
        case Trigger::Pause:
            if (from == Phase::Idle || from == Phase::Recording ||
                from == Phase::Transcribing || from == Phase::Processing) {
                return Phase::Paused;
            }
            break;
        case Trigger::Resume:
            if (from == Phase::Paused) return Phase::Idle;
            break;
        case Trigger::Restart:
            return Phase::Restarting;
        case Trigger::RestartComplete:
            if (from == Phase::Restarting) return Phase::Idle;
            break;
        case Trigger::Shutdown:
            return Phase::ShuttingDown;
        case Trigger::CaptureFailed:
            if (from == Phase::Recording || from == Phase::Error) return Phase::Idle;
            break;
    }
    return std::nullopt;
}

nlohmann::json state_json(const DaemonState& state) {
    nlohmann::json j = {
        {"phase", phase_name(state.phase)},
        {"sequence", state.sequence},
        {"owner", nullptr},
        {"transcript", state.transcript},
        {"last_error", nullptr},
    };
    if (state.owner) j["owner"] = *state.owner;
    if (state.last_error) j["last_error"] = *state.last_error;
    return j;
}

DaemonError StateMachine::rejection(Trigger trigger) const {
    auto phase = state_.phase;
    bool starts_workflow = trigger == Trigger::StartRecording || trigger == Trigger::ProcessText;
    bool resource_held = phase == Phase::Recording || phase == Phase::Transcribing ||
                         phase == Phase::Processing || phase == Phase::Restarting;

    if (starts_workflow && resource_held) {
        if (phase == Phase::Recording && trigger == Trigger::StartRecording) {
            return {ErrorKind::StateConflict, "already recording"};
        }
        return {ErrorKind::StateConflict,
                std::format("cannot {}: daemon is busy ({})", trigger_name(trigger), phase_name(phase))};
    }
    if (phase == Phase::Paused && starts_workflow) {
        return {ErrorKind::Protocol, "daemon is paused"};
    }
    return {ErrorKind::Protocol,
            std::format("cannot {} while {}", trigger_name(trigger), phase_name(phase))};
}

std::expected<StateEvent, DaemonError> StateMachine::apply(Trigger trigger, TransitionInput input) {
    auto target = next_phase(state_.phase, trigger);
    if (!target) return std::unexpected(rejection(trigger));

    Phase from = state_.phase;

    switch (trigger) {
        case Trigger::StartRecording:
            state_.owner = input.owner;
            state_.transcript.clear();
            state_.last_error.reset();
            break;
        case Trigger::StopRecording:
            break;
        case Trigger::TranscriptionDone:
            state_.owner.reset();
            state_.transcript = std::move(input.transcript);
            break;
        case Trigger::ProcessText:
        case Trigger::RefinementDone:
            state_.last_error.reset();
            break;
        case Trigger::TranscriptionFailed:
        case Trigger::RefinementFailed:
        case Trigger::CaptureFailed:
            state_.owner.reset();
            if (input.error) state_.last_error = input.error->message;
            break;
        case Trigger::Pause:
        case Trigger::Shutdown:
            state_.owner.reset();
            break;
        case Trigger::Resume:
        case Trigger::RestartComplete:
            break;
        case Trigger::Restart:
            state_.owner.reset();
            state_.transcript.clear();
            state_.last_error.reset();
            break;
    }

    state_.phase = *target;
    ++state_.sequence;

    return StateEvent{
        .from = from,
        .to = *target,
        .trigger = trigger,
        .snapshot = state_,
        .data = std::move(input.data),
        .error = std::move(input.error),
    };
}
