#pragma once

#include "daemon_state.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

// Builders for the outbound JSON objects. Responses answer one request;
// events are broadcast to every session.
namespace messages {

nlohmann::json success(const DaemonState& state, nlohmann::json data = nullptr);
nlohmann::json failure(const DaemonState& state, const DaemonError& error,
                       nlohmann::json data = nullptr);
nlohmann::json event(const StateEvent& ev);

} // namespace messages
