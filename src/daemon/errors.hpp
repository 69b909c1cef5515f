#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    Framing,        // malformed or oversized wire data, closes the connection
    Protocol,       // bad request or command invalid for the phase
    AudioDevice,
    Transcription,
    Refinement,
    StateConflict,  // resource held by another session's workflow
};

struct DaemonError {
    ErrorKind kind;
    std::string message;
};

constexpr std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Framing: return "FramingError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::AudioDevice: return "AudioDeviceError";
        case ErrorKind::Transcription: return "TranscriptionError";
        case ErrorKind::Refinement: return "RefinementError";
        case ErrorKind::StateConflict: return "StateConflictError";
    }
    return "UnknownError";
}
