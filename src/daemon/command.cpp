#include "command.hpp"

#include <array>
#include <utility>

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<std::string_view, CommandKind>, 15> COMMAND_NAMES = {{
    {"START_RECORDING", CommandKind::StartRecording},
    {"STOP_RECORDING", CommandKind::StopRecording},
    {"TOGGLE_RECORDING", CommandKind::ToggleRecording},
    {"GET_STATUS", CommandKind::GetStatus},
    {"PROCESS_TEXT", CommandKind::ProcessText},
    {"TRANSLATE_TEXT", CommandKind::TranslateText},
    {"PAUSE", CommandKind::Pause},
    {"RESUME", CommandKind::Resume},
    {"RESTART", CommandKind::Restart},
    {"SHUTDOWN", CommandKind::Shutdown},
    {"PING", CommandKind::Ping},
    {"GET_CONFIG", CommandKind::GetConfig},
    {"UPDATE_CONFIG", CommandKind::UpdateConfig},
    {"PAUSE_DAEMON", CommandKind::Pause},
    {"RESUME_DAEMON", CommandKind::Resume},
}};

DaemonError protocol_error(std::string msg) {
    return {ErrorKind::Protocol, std::move(msg)};
}

std::expected<std::string, DaemonError>
required_string(const json& payload, const char* key, std::string_view command) {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::unexpected(protocol_error(std::string(command) + ": missing field '" + key + "'"));
    }
    if (!it->is_string()) {
        return std::unexpected(protocol_error(std::string(command) + ": field '" + key + "' must be a string"));
    }
    auto value = it->get<std::string>();
    if (value.find_first_not_of(" \t\n\r") == std::string::npos) {
        return std::unexpected(protocol_error(std::string(command) + ": field '" + key + "' is empty"));
    }
    return value;
}

} // namespace

std::string_view command_name(CommandKind kind) {
    for (const auto& [name, k] : COMMAND_NAMES) {
        if (k == kind) return name;
    }
    return "UNKNOWN";
}

std::optional<CommandKind> command_from_name(std::string_view name) {
    for (const auto& [n, kind] : COMMAND_NAMES) {
        if (n == name) return kind;
    }
    return std::nullopt;
}

std::expected<Command, DaemonError> parse_command(SessionId session, std::string_view payload) {
    json msg = json::parse(payload, nullptr, false);
    if (msg.is_discarded()) {
        return std::unexpected(protocol_error("malformed JSON"));
    }
    if (!msg.is_object()) {
        return std::unexpected(protocol_error("request must be a JSON object"));
    }

    auto name_it = msg.find("command");
    if (name_it == msg.end()) name_it = msg.find("cmd");
    if (name_it == msg.end() || !name_it->is_string()) {
        return std::unexpected(protocol_error("missing 'command'"));
    }

    auto name = name_it->get<std::string>();
    auto kind = command_from_name(name);
    if (!kind) {
        return std::unexpected(protocol_error("unknown command: " + name));
    }

    json body = json::object();
    auto body_it = msg.find("payload");
    if (body_it == msg.end()) body_it = msg.find("data");
    if (body_it != msg.end() && !body_it->is_null()) {
        if (!body_it->is_object()) {
            return std::unexpected(protocol_error(name + ": payload must be an object"));
        }
        body = *body_it;
    }

    Command cmd{.kind = *kind, .payload = NoPayload{}, .session = session};

    switch (*kind) {
        case CommandKind::ProcessText: {
            auto text = required_string(body, "text", name);
            if (!text) return std::unexpected(text.error());
            cmd.payload = TextPayload{std::move(*text)};
            break;
        }
        case CommandKind::TranslateText: {
            auto text = required_string(body, "text", name);
            if (!text) return std::unexpected(text.error());
            auto lang = required_string(body, "target_lang", name);
            if (!lang) return std::unexpected(lang.error());
            cmd.payload = TranslatePayload{std::move(*text), std::move(*lang)};
            break;
        }
        case CommandKind::UpdateConfig: {
            auto it = body.find("updates");
            if (it == body.end() || !it->is_object()) {
                return std::unexpected(protocol_error(name + ": 'updates' must be an object"));
            }
            cmd.payload = ConfigUpdatePayload{*it};
            break;
        }
        default:
            break;
    }
    return cmd;
}
