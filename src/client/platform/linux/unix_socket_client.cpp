#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient(size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes), decoder_(max_frame_bytes) {}

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    close();

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        close();
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close();
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;

    auto encoded = frame::encode(cmd.dump(), max_frame_bytes_);
    if (!encoded) {
        std::println(stderr, "ipc: {}", encoded.error());
        return false;
    }

    std::string_view rest = *encoded;
    while (!rest.empty()) {
        ssize_t sent = ::send(fd_, rest.data(), rest.size(), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            close();
            return false;
        }
        rest.remove_prefix(static_cast<size_t>(sent));
    }
    return true;
}

bool UnixSocketClient::take_buffered(nlohmann::json& message) {
    auto next = decoder_.next();
    if (!next) {
        std::println(stderr, "ipc: {}", next.error());
        close();
        return false;
    }
    if (!next->has_value()) return false;

    message = nlohmann::json::parse(**next, nullptr, false);
    if (message.is_discarded()) {
        std::println(stderr, "ipc: daemon sent malformed JSON");
        close();
        return false;
    }
    return true;
}

bool UnixSocketClient::recv(nlohmann::json& message, int timeout_ms) {
    if (fd_ < 0) return false;
    if (take_buffered(message)) return true;
    if (fd_ < 0) return false;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;

        int ret = ::poll(&pfd, 1, static_cast<int>(left));
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char tmp[16384];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            close();
            return false;
        }

        decoder_.feed(tmp, static_cast<size_t>(n));
        if (take_buffered(message)) return true;
        if (fd_ < 0) return false;
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    decoder_.reset();
}
