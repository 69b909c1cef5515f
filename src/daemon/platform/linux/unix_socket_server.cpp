#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

bool make_address(const std::string& path, sockaddr_un& addr) {
    addr = {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

// True if something accepts connections on `path`.
bool endpoint_alive(const sockaddr_un& addr) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    bool alive = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return alive;
}

} // namespace

UnixSocketServer::UnixSocketServer(size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

UnixSocketServer::~UnixSocketServer() {
    stop();
}

std::expected<void, std::string> UnixSocketServer::start(const std::string& socket_path) {
    sockaddr_un addr;
    if (!make_address(socket_path, addr)) {
        return std::unexpected("socket path too long: " + socket_path);
    }

    struct stat st;
    if (::lstat(socket_path.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            return std::unexpected(socket_path + " exists and is not a socket");
        }
        if (endpoint_alive(addr)) {
            return std::unexpected("daemon already running on " + socket_path);
        }
        std::println(stderr, "ipc: removing stale socket {}", socket_path);
        ::unlink(socket_path.c_str());
    }

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return std::unexpected(std::format("socket() failed: {}", std::strerror(errno)));
    }

    auto fail = [this](const char* what) {
        auto msg = std::format("{}() failed: {}", what, std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return std::unexpected(msg);
    };

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail("bind");
    }
    socket_path_ = socket_path;
    ::chmod(socket_path.c_str(), 0600);

    if (::listen(server_fd_, 16) < 0) {
        ::unlink(socket_path.c_str());
        socket_path_.clear();
        return fail("listen");
    }

    return {};
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::println(stderr, "ipc: accept4() failed: {}", std::strerror(errno));
        }
        return -1;
    }
    clients_.push_back({fd, frame::Decoder(max_frame_bytes_)});
    return fd;
}

ReadResult UnixSocketServer::read_messages(int client_fd) {
    ReadResult result;
    auto* client = find_client(client_fd);
    if (!client) {
        result.status = ReadResult::Status::Closed;
        return result;
    }

    char buf[16384];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return result;
        result.status = ReadResult::Status::Closed;
        return result;
    }
    if (n == 0) {
        if (auto fin = client->decoder.finish(); !fin) {
            std::println(stderr, "ipc: client fd {} {}", client_fd, fin.error());
        }
        result.status = ReadResult::Status::Closed;
        return result;
    }

    client->decoder.feed(buf, static_cast<size_t>(n));
    while (true) {
        auto next = client->decoder.next();
        if (!next) {
            result.status = ReadResult::Status::FramingError;
            result.error = next.error();
            break;
        }
        if (!next->has_value()) break;
        result.messages.push_back(std::move(**next));
    }
    return result;
}

std::expected<size_t, std::string> UnixSocketServer::write_some(int client_fd, std::string_view data) {
    ssize_t sent = ::send(client_fd, data.data(), data.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    if (sent < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
        return std::unexpected(std::format("send() failed: {}", std::strerror(errno)));
    }
    return static_cast<size_t>(sent);
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
