#pragma once

#include "platform/ipc_server.hpp"
#include "protocol/frame_codec.hpp"

#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    explicit UnixSocketServer(size_t max_frame_bytes = frame::DEFAULT_MAX_PAYLOAD);
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    // Fails if another daemon answers on `endpoint`; a dead socket file is replaced.
    std::expected<void, std::string> start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadResult read_messages(int client_fd) override;
    std::expected<size_t, std::string> write_some(int client_fd, std::string_view data) override;
    void close_client(int client_fd) override;

    size_t client_count() const { return clients_.size(); }

private:
    size_t max_frame_bytes_;
    int server_fd_ = -1;
    std::string socket_path_;

    struct ClientBuffer {
        int fd;
        frame::Decoder decoder;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
};
