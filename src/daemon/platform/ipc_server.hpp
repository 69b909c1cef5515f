#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

// Result of draining one readable client socket.
struct ReadResult {
    enum class Status { Open, Closed, FramingError };

    std::vector<std::string> messages;   // complete payloads, in arrival order
    Status status = Status::Open;
    std::string error;                   // FramingError detail
};

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual std::expected<void, std::string> start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadResult read_messages(int client_fd) = 0;
    // Non-blocking. Returns bytes written (0 if the socket is full).
    virtual std::expected<size_t, std::string> write_some(int client_fd, std::string_view data) = 0;
    virtual void close_client(int client_fd) = 0;
};
