#include <catch2/catch_test_macros.hpp>

#include "daemon_state.hpp"

#include <array>

namespace {

constexpr std::array ALL_PHASES = {
    Phase::Idle, Phase::Recording, Phase::Transcribing, Phase::Processing,
    Phase::Paused, Phase::Error, Phase::Restarting, Phase::ShuttingDown,
};

constexpr std::array ALL_TRIGGERS = {
    Trigger::StartRecording, Trigger::StopRecording, Trigger::TranscriptionDone,
    Trigger::TranscriptionFailed, Trigger::ProcessText, Trigger::RefinementDone,
    Trigger::RefinementFailed, Trigger::Pause, Trigger::Resume, Trigger::Restart,
    Trigger::RestartComplete, Trigger::Shutdown, Trigger::CaptureFailed,
};

// Drives a fresh machine into `phase` through legal transitions.
StateMachine machine_in(Phase phase) {
    StateMachine sm;
    auto go = [&](Trigger t) { REQUIRE(sm.apply(t).has_value()); };
    switch (phase) {
        case Phase::Idle: break;
        case Phase::Recording: go(Trigger::StartRecording); break;
        case Phase::Transcribing: go(Trigger::StartRecording); go(Trigger::StopRecording); break;
        case Phase::Processing: go(Trigger::ProcessText); break;
        case Phase::Paused: go(Trigger::Pause); break;
        case Phase::Error: go(Trigger::ProcessText); go(Trigger::RefinementFailed); break;
        case Phase::Restarting: go(Trigger::Restart); break;
        case Phase::ShuttingDown: go(Trigger::Shutdown); break;
    }
    REQUIRE(sm.phase() == phase);
    return sm;
}

} // namespace

TEST_CASE("Transition table", "[state]") {

    SECTION("WorkflowPath") {
        REQUIRE(next_phase(Phase::Idle, Trigger::StartRecording) == Phase::Recording);
        REQUIRE(next_phase(Phase::Recording, Trigger::StopRecording) == Phase::Transcribing);
        REQUIRE(next_phase(Phase::Transcribing, Trigger::TranscriptionDone) == Phase::Idle);
        REQUIRE(next_phase(Phase::Transcribing, Trigger::TranscriptionFailed) == Phase::Error);
        REQUIRE(next_phase(Phase::Idle, Trigger::ProcessText) == Phase::Processing);
        REQUIRE(next_phase(Phase::Processing, Trigger::RefinementDone) == Phase::Idle);
        REQUIRE(next_phase(Phase::Processing, Trigger::RefinementFailed) == Phase::Error);
    }

    SECTION("ErrorIsARestingPhase") {
        REQUIRE(next_phase(Phase::Error, Trigger::StartRecording) == Phase::Recording);
        REQUIRE(next_phase(Phase::Error, Trigger::ProcessText) == Phase::Processing);
        REQUIRE(next_phase(Phase::Error, Trigger::CaptureFailed) == Phase::Idle);
    }

    SECTION("PauseFromActivePhases") {
        for (auto p : {Phase::Idle, Phase::Recording, Phase::Transcribing, Phase::Processing}) {
            REQUIRE(next_phase(p, Trigger::Pause) == Phase::Paused);
        }
        REQUIRE_FALSE(next_phase(Phase::Paused, Trigger::Pause).has_value());
        REQUIRE_FALSE(next_phase(Phase::Error, Trigger::Pause).has_value());
        REQUIRE(next_phase(Phase::Paused, Trigger::Resume) == Phase::Idle);
    }

    SECTION("RestartAndShutdownFromAnyLivePhase") {
        for (auto p : ALL_PHASES) {
            if (p == Phase::ShuttingDown) continue;
            REQUIRE(next_phase(p, Trigger::Restart) == Phase::Restarting);
            REQUIRE(next_phase(p, Trigger::Shutdown) == Phase::ShuttingDown);
        }
        REQUIRE(next_phase(Phase::Restarting, Trigger::RestartComplete) == Phase::Idle);
    }

    SECTION("ShuttingDownIsTerminal") {
        for (auto t : ALL_TRIGGERS) {
            REQUIRE_FALSE(next_phase(Phase::ShuttingDown, t).has_value());
        }
    }

    SECTION("CaptureFailureOnlyWhileRecordingOrError") {
        for (auto p : ALL_PHASES) {
            bool allowed = p == Phase::Recording || p == Phase::Error;
            REQUIRE(next_phase(p, Trigger::CaptureFailed).has_value() == allowed);
        }
    }

    SECTION("PhaseNames") {
        REQUIRE(phase_name(Phase::Idle) == "idle");
        REQUIRE(phase_name(Phase::ShuttingDown) == "shutting_down");
        REQUIRE(phase_name(Phase::Transcribing) == "transcribing");
    }
}

TEST_CASE("StateMachine", "[state]") {

    SECTION("SequenceIncrementsOncePerTransition") {
        StateMachine sm;
        REQUIRE(sm.state().sequence == 0);
        auto ev = sm.apply(Trigger::StartRecording, {.owner = 7});
        REQUIRE(ev.has_value());
        REQUIRE(ev->snapshot.sequence == 1);
        REQUIRE(ev->from == Phase::Idle);
        REQUIRE(ev->to == Phase::Recording);
        REQUIRE(sm.state().owner == 7u);
    }

    SECTION("RejectedTriggerLeavesStateUnchanged") {
        for (auto p : ALL_PHASES) {
            for (auto t : ALL_TRIGGERS) {
                if (next_phase(p, t)) continue;
                auto sm = machine_in(p);
                auto before = sm.state().sequence;
                auto res = sm.apply(t);
                REQUIRE_FALSE(res.has_value());
                REQUIRE(sm.phase() == p);
                REQUIRE(sm.state().sequence == before);
            }
        }
    }

    SECTION("StartWhileRecordingIsStateConflict") {
        auto sm = machine_in(Phase::Recording);
        auto err = sm.rejection(Trigger::StartRecording);
        REQUIRE(err.kind == ErrorKind::StateConflict);
        REQUIRE(err.message == "already recording");
    }

    SECTION("WorkflowStartWhileBusyIsStateConflict") {
        for (auto p : {Phase::Recording, Phase::Transcribing, Phase::Processing, Phase::Restarting}) {
            auto sm = machine_in(p);
            REQUIRE(sm.rejection(Trigger::ProcessText).kind == ErrorKind::StateConflict);
            REQUIRE(sm.rejection(Trigger::StartRecording).kind == ErrorKind::StateConflict);
        }
    }

    SECTION("OtherMismatchesAreProtocolErrors") {
        REQUIRE(machine_in(Phase::Idle).rejection(Trigger::StopRecording).kind == ErrorKind::Protocol);
        REQUIRE(machine_in(Phase::Idle).rejection(Trigger::Resume).kind == ErrorKind::Protocol);
        REQUIRE(machine_in(Phase::Paused).rejection(Trigger::StartRecording).kind == ErrorKind::Protocol);
    }

    SECTION("TranscriptionDoneStoresTranscript") {
        auto sm = machine_in(Phase::Transcribing);
        auto ev = sm.apply(Trigger::TranscriptionDone, {.transcript = "hello there"});
        REQUIRE(ev.has_value());
        REQUIRE(sm.state().transcript == "hello there");
        REQUIRE_FALSE(sm.state().owner.has_value());
    }

    SECTION("NewRecordingClearsTranscriptAndError") {
        auto sm = machine_in(Phase::Transcribing);
        sm.apply(Trigger::TranscriptionFailed, {.error = DaemonError{ErrorKind::Transcription, "boom"}});
        REQUIRE(sm.state().last_error == "boom");

        REQUIRE(sm.apply(Trigger::StartRecording, {.owner = 2}).has_value());
        REQUIRE(sm.state().transcript.empty());
        REQUIRE_FALSE(sm.state().last_error.has_value());
    }

    SECTION("StateJsonShape") {
        auto sm = machine_in(Phase::Recording);
        auto j = state_json(sm.state());
        REQUIRE(j["phase"] == "recording");
        REQUIRE(j["sequence"] == 1);
        REQUIRE(j["owner"].is_null());
        REQUIRE(j["last_error"].is_null());
        REQUIRE(j["transcript"] == "");
    }
}
