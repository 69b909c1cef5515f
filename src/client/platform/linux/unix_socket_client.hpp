#pragma once

#include "platform/ipc_client.hpp"
#include "protocol/frame_codec.hpp"

class UnixSocketClient : public IpcClient {
public:
    explicit UnixSocketClient(size_t max_frame_bytes = frame::DEFAULT_MAX_PAYLOAD);
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& message, int timeout_ms = 30000) override;
    bool connected() const override { return fd_ >= 0; }
    void close() override;

private:
    // Parses the next buffered frame, if any.
    bool take_buffered(nlohmann::json& message);

    int fd_ = -1;
    size_t max_frame_bytes_;
    frame::Decoder decoder_;
};
