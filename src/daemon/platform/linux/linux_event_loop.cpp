#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/messages.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

constexpr long TICK_MS = 50;
constexpr auto FINAL_FLUSH_TIMEOUT = std::chrono::milliseconds(500);

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(config_.audio.ring_buffer_samples()),
      audio_capture_(ring_buf_, config_.audio.sample_rate),
      ipc_server_(config_.ipc.max_frame_bytes),
      sessions_(config_.ipc.queue_capacity),
      core_(config_, verbose_, audio_capture_, sessions_,
            make_http_engines,
            // NotifyCallback, called from worker threads
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    remove_pid_file();
}

bool LinuxEventLoop::init() {
    // Private runtime directory, then the socket inside it
    auto dir = platform::runtime_dir();
    if (auto res = platform::ensure_private_dir(dir); !res) {
        std::println(stderr, "Runtime directory {} rejected: {}", dir, res.error());
        return false;
    }

    auto ipc_path = platform::ipc_endpoint();
    if (auto res = ipc_server_.start(ipc_path); !res) {
        std::println(stderr, "ipc: {}", res.error());
        return false;
    }
    log("IPC listening on " + ipc_path);

    // Core init (speech engine, VAD, LLM provider)
    if (!core_.init()) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Periodic tick for capture draining
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    itimerspec tick{};
    tick.it_interval.tv_nsec = TICK_MS * 1'000'000;
    tick.it_value.tv_nsec = TICK_MS * 1'000'000;
    if (timerfd_settime(timer_fd_, 0, &tick, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    if (!write_pid_file()) {
        std::println(stderr, "Warning: could not write pid file {}", platform::pid_file());
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                core_.request_shutdown();
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                accept_clients();
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd read failed: {}", std::strerror(errno));
                }
                core_.on_worker_complete();
                continue;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "timerfd read failed: {}", std::strerror(errno));
                }
                core_.on_tick();
                continue;
            }

            handle_client(fd, events[i].events);
        }

        flush_all();
        reap_sessions();

        if (core_.shutdown_requested()) {
            running_.store(false, std::memory_order_release);
        }
    }

    // Clean shutdown
    core_.request_shutdown();
    drain_before_exit();
    core_.shutdown();
    ipc_server_.stop();
    remove_pid_file();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::accept_clients() {
    while (true) {
        int client_fd = ipc_server_.accept_client();
        if (client_fd < 0) return;

        epoll_event ev{.events = EPOLLIN | EPOLLRDHUP, .data = {.fd = client_fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl add client failed: {}", std::strerror(errno));
            ipc_server_.close_client(client_fd);
            continue;
        }
        auto& session = sessions_.add(client_fd);
        log(std::format("Session {} connected (fd {})", session.id(), client_fd));
    }
}

void LinuxEventLoop::handle_client(int fd, uint32_t events) {
    auto* session = sessions_.find_by_fd(fd);
    if (!session) return;

    if (events & EPOLLOUT) {
        flush(*session);
    }

    if (!(events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR))) return;

    // A session closing after a framing error only drains its queue.
    if (session->closing()) {
        if (events & (EPOLLHUP | EPOLLERR)) session->mark_dead();
        return;
    }

    auto result = ipc_server_.read_messages(fd);
    for (auto& msg : result.messages) {
        auto response = core_.handle_message(session->id(), msg);
        send_response(*session, response);
    }

    switch (result.status) {
        case ReadResult::Status::Open:
            break;
        case ReadResult::Status::Closed:
            session->mark_dead();
            break;
        case ReadResult::Status::FramingError:
            std::println(stderr, "ipc: session {}: {}", session->id(), result.error);
            send_response(*session, messages::failure(core_.state(),
                                                      DaemonError{ErrorKind::Framing, result.error}));
            session->close_after_flush();
            break;
    }
}

void LinuxEventLoop::send_response(Session& session, const nlohmann::json& response) {
    auto encoded = frame::encode(response.dump(), config_.ipc.max_frame_bytes);
    if (!encoded) {
        std::println(stderr, "ipc: response too large for session {}: {}", session.id(), encoded.error());
        encoded = frame::encode(messages::failure(core_.state(),
                                                  DaemonError{ErrorKind::Framing, encoded.error()}).dump(),
                                config_.ipc.max_frame_bytes);
        if (!encoded) return;
    }

    if (session.enqueue(std::move(*encoded), false) == Session::Enqueue::Overflow) {
        std::println(stderr, "ipc: session {} queue overflow, evicting", session.id());
    }
}

void LinuxEventLoop::flush(Session& session) {
    while (session.alive() && session.has_pending()) {
        auto written = ipc_server_.write_some(session.fd(), session.pending());
        if (!written) {
            log(std::format("Session {} write failed: {}", session.id(), written.error()));
            session.mark_dead();
            return;
        }
        if (*written == 0) break;
        session.consume(*written);
    }
}

void LinuxEventLoop::flush_all() {
    sessions_.for_each([this](Session& s) {
        if (!s.alive()) return;
        flush(s);
        update_interest(s);
    });
}

void LinuxEventLoop::update_interest(Session& session) {
    if (!session.alive()) return;

    // A closing session is only drained; its further input is ignored.
    uint32_t want = session.closing() ? EPOLLRDHUP : EPOLLIN | EPOLLRDHUP;
    if (session.has_pending()) want |= EPOLLOUT;

    auto it = interest_.find(session.fd());
    uint32_t current = it != interest_.end() ? it->second : EPOLLIN | EPOLLRDHUP;
    if (want == current) return;

    epoll_event ev{.events = want, .data = {.fd = session.fd()}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, session.fd(), &ev) < 0) {
        std::println(stderr, "epoll_ctl mod failed: {}", std::strerror(errno));
        session.mark_dead();
        return;
    }
    interest_[session.fd()] = want;
}

void LinuxEventLoop::reap_sessions() {
    for (SessionId id : sessions_.dead_sessions()) {
        auto* session = sessions_.find(id);
        if (!session) continue;

        int fd = session->fd();
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        interest_.erase(fd);
        ipc_server_.close_client(fd);
        sessions_.remove(id);
        core_.on_session_closed(id);
        log(std::format("Session {} disconnected", id));
    }
}

void LinuxEventLoop::drain_before_exit() {
    auto deadline = std::chrono::steady_clock::now() + FINAL_FLUSH_TIMEOUT;
    epoll_event events[16];

    while (std::chrono::steady_clock::now() < deadline) {
        flush_all();

        bool pending = false;
        sessions_.for_each([&](Session& s) {
            if (s.alive() && s.has_pending()) pending = true;
        });
        if (!pending) return;

        // Wake on EPOLLOUT or give the peers a moment.
        epoll_wait(epoll_fd_, events, 16, 10);
    }
    log("Final flush timed out; some clients may miss the shutdown event");
}

bool LinuxEventLoop::write_pid_file() {
    pid_path_ = platform::pid_file();
    FILE* f = std::fopen(pid_path_.c_str(), "w");
    if (!f) {
        pid_path_.clear();
        return false;
    }
    std::println(f, "{}", ::getpid());
    std::fclose(f);
    return true;
}

void LinuxEventLoop::remove_pid_file() {
    if (!pid_path_.empty()) {
        ::unlink(pid_path_.c_str());
        pid_path_.clear();
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[v2m] {}", msg);
    }
}
