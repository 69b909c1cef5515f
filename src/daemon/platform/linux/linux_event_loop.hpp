#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "ring_buffer.hpp"
#include "session_registry.hpp"

#include <atomic>
#include <string>
#include <unordered_map>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void accept_clients();
    void handle_client(int fd, uint32_t events);
    void send_response(Session& session, const nlohmann::json& response);
    void flush(Session& session);
    void flush_all();
    void update_interest(Session& session);
    void reap_sessions();
    // Gives queued frames (the final shutdown event among them) a bounded
    // chance to reach clients before the sockets close.
    void drain_before_exit();

    bool write_pid_file();
    void remove_pid_file();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    UnixSocketServer ipc_server_;
    SessionRegistry sessions_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int timer_fd_ = -1;

    // Current epoll mask per client fd.
    std::unordered_map<int, uint32_t> interest_;
    std::string pid_path_;

    std::atomic<bool> running_{false};
};
