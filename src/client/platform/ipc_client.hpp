#pragma once

#include <nlohmann/json.hpp>
#include <string>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // False on timeout or when the connection is gone; connected() tells which.
    virtual bool recv(nlohmann::json& message, int timeout_ms = 30000) = 0;
    virtual bool connected() const = 0;
    virtual void close() = 0;
};
