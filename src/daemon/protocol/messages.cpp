#include "protocol/messages.hpp"

#include <string>

namespace messages {

nlohmann::json success(const DaemonState& state, nlohmann::json data) {
    return {
        {"type", "response"},
        {"status", "success"},
        {"data", std::move(data)},
        {"error", nullptr},
        {"error_type", nullptr},
        {"state", state_json(state)},
    };
}

nlohmann::json failure(const DaemonState& state, const DaemonError& error, nlohmann::json data) {
    return {
        {"type", "response"},
        {"status", "error"},
        {"data", std::move(data)},
        {"error", error.message},
        {"error_type", std::string(error_kind_name(error.kind))},
        {"state", state_json(state)},
    };
}

nlohmann::json event(const StateEvent& ev) {
    nlohmann::json j = {
        {"type", "event"},
        {"status", ev.error ? "error" : "success"},
        {"data", ev.data},
        {"error", nullptr},
        {"error_type", nullptr},
        {"state", state_json(ev.snapshot)},
    };
    j["state"]["previous"] = phase_name(ev.from);
    if (ev.error) {
        j["error"] = ev.error->message;
        j["error_type"] = std::string(error_kind_name(ev.error->kind));
    }
    return j;
}

} // namespace messages
