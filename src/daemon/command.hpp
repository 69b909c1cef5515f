#pragma once

#include "errors.hpp"
#include "session_id.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

enum class CommandKind {
    StartRecording,
    StopRecording,
    ToggleRecording,
    GetStatus,
    ProcessText,
    TranslateText,
    Pause,
    Resume,
    Restart,
    Shutdown,
    Ping,
    GetConfig,
    UpdateConfig,
};

struct NoPayload {};

struct TextPayload {
    std::string text;
};

struct TranslatePayload {
    std::string text;
    std::string target_lang;
};

struct ConfigUpdatePayload {
    nlohmann::json updates;
};

using CommandPayload = std::variant<NoPayload, TextPayload, TranslatePayload, ConfigUpdatePayload>;

struct Command {
    CommandKind kind;
    CommandPayload payload;
    SessionId session = 0;
};

std::string_view command_name(CommandKind kind);

// Accepts the canonical names and the PAUSE_DAEMON / RESUME_DAEMON aliases.
std::optional<CommandKind> command_from_name(std::string_view name);

// Decodes one request frame: {"command": NAME, "payload": {...}}, with
// "cmd" / "data" accepted in place of "command" / "payload".
std::expected<Command, DaemonError> parse_command(SessionId session, std::string_view payload);
