#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "fakes.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "protocol/frame_codec.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/v2m_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Unframed client for feeding the server arbitrary bytes.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void raw_send(int fd, std::string_view bytes) {
    REQUIRE(::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(bytes.size()));
}

// Reads until at least one message arrives or the connection changes state.
ReadResult read_some(UnixSocketServer& server, int fd) {
    ReadResult all;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(1000);
    while (std::chrono::steady_clock::now() < deadline) {
        auto r = server.read_messages(fd);
        for (auto& m : r.messages) all.messages.push_back(std::move(m));
        if (r.status != ReadResult::Status::Open) {
            all.status = r.status;
            all.error = r.error;
            break;
        }
        if (!all.messages.empty()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return all;
}

std::string framed(const json& j) {
    return *frame::encode(j.dump());
}

} // namespace

TEST_CASE("IPC transport", "[ipc]") {
    auto sock_path = tmp_socket_path();
    std::filesystem::remove(sock_path);

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::is_socket(sock_path));

        struct stat st{};
        REQUIRE(::stat(sock_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);

        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("StaleSocketReplaced") {
        {
            // Bound and closed without unlinking, as after a crash
            int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
            REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
            ::close(fd);
        }
        REQUIRE(std::filesystem::exists(sock_path));

        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
    }

    SECTION("SecondDaemonRefused") {
        UnixSocketServer first;
        REQUIRE(first.start(sock_path));

        UnixSocketServer second;
        auto r = second.start(sock_path);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().find("already running") != std::string::npos);

        // The first daemon's socket is untouched
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        REQUIRE(first.accept_client() >= 0);
    }

    SECTION("RegularFileNotReplaced") {
        std::ofstream(sock_path) << "important";
        UnixSocketServer server;
        REQUIRE_FALSE(server.start(sock_path));
        REQUIRE(std::filesystem::is_regular_file(sock_path));
        std::filesystem::remove(sock_path);
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int fd = server.accept_client();
        REQUIRE(fd >= 0);
        REQUIRE(server.client_count() == 1);

        REQUIRE(client.send({{"command", "GET_STATUS"}}));
        auto r = read_some(server, fd);
        REQUIRE(r.status == ReadResult::Status::Open);
        REQUIRE(r.messages.size() == 1);
        REQUIRE(json::parse(r.messages[0])["command"] == "GET_STATUS");

        auto bytes = framed({{"type", "response"}, {"status", "success"}});
        REQUIRE(server.write_some(fd, bytes) == bytes.size());

        json reply;
        REQUIRE(client.recv(reply, 1000));
        REQUIRE(reply["status"] == "success");

        server.close_client(fd);
        REQUIRE(server.client_count() == 0);
    }

    SECTION("ManyFramesInOneWrite") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int fd = server.accept_client();

        std::string batch;
        for (int i = 0; i < 5; ++i) batch += framed({{"seq", i}});
        REQUIRE(server.write_some(fd, batch) == batch.size());

        for (int i = 0; i < 5; ++i) {
            json msg;
            REQUIRE(client.recv(msg, 1000));
            REQUIRE(msg["seq"] == i);
        }
    }

    SECTION("FrameSplitAcrossWrites") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int fd = server.accept_client();

        auto bytes = framed({{"command", "PING"}});
        raw_send(raw, bytes.substr(0, 2));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        REQUIRE(server.read_messages(fd).messages.empty());

        raw_send(raw, bytes.substr(2));
        auto r = read_some(server, fd);
        REQUIRE(r.messages.size() == 1);
        ::close(raw);
    }

    SECTION("UnframedJsonIsFramingError") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int raw = raw_connect(sock_path);
        int fd = server.accept_client();

        raw_send(raw, R"({"command":"PING"})");
        auto r = read_some(server, fd);
        REQUIRE(r.status == ReadResult::Status::FramingError);
        REQUIRE(r.error.find("protocol mismatch") != std::string::npos);
        ::close(raw);
    }

    SECTION("OversizedFrameIsFramingError") {
        UnixSocketServer server(64);
        REQUIRE(server.start(sock_path));
        int raw = raw_connect(sock_path);
        int fd = server.accept_client();

        raw_send(raw, std::string("\x00\x01\x00\x00", 4));
        auto r = read_some(server, fd);
        REQUIRE(r.status == ReadResult::Status::FramingError);
        ::close(raw);
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int fd = server.accept_client();

        client.close();
        REQUIRE(read_some(server, fd).status == ReadResult::Status::Closed);
        server.close_client(fd);
    }

    SECTION("ClientSeesServerGone") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int fd = server.accept_client();

        server.close_client(fd);
        json msg;
        REQUIRE_FALSE(client.recv(msg, 1000));
        REQUIRE_FALSE(client.connected());
    }

    SECTION("RecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        server.accept_client();

        json msg;
        REQUIRE_FALSE(client.recv(msg, 20));
        REQUIRE(client.connected());
    }

    std::filesystem::remove(sock_path);
}

namespace {

// A daemon core served over a real socket, pumped by hand.
struct ServedCore {
    UnixSocketServer server;
    SessionRegistry sessions{8};
    FakeCapture capture;
    std::shared_ptr<FakeSpeechEngine> speech = std::make_shared<FakeSpeechEngine>();
    DaemonCore core;

    explicit ServedCore(const std::string& path)
        : core(test_config(), false, capture, sessions,
               [this](const Config&) -> std::expected<Engines, std::string> {
                   return Engines{.speech = speech, .vad = std::make_shared<FakeVad>(),
                                  .llm = std::make_shared<FakeLlm>()};
               },
               [] {}) {
        REQUIRE(core.init());
        REQUIRE(server.start(path));
    }

    SessionId accept() {
        int fd = server.accept_client();
        REQUIRE(fd >= 0);
        return sessions.add(fd).id();
    }

    // Handles everything readable, then writes every queued frame.
    void pump() {
        std::vector<Session*> all;
        sessions.for_each([&](Session& s) { all.push_back(&s); });
        for (auto* s : all) {
            auto r = server.read_messages(s->fd());
            for (auto& payload : r.messages) {
                auto response = core.handle_message(s->id(), payload);
                s->enqueue(*frame::encode(response.dump()), false);
            }
        }
        flush();
    }

    void flush() {
        sessions.for_each([&](Session& s) {
            while (s.has_pending()) {
                auto n = server.write_some(s.fd(), s.pending());
                REQUIRE(n);
                if (*n == 0) break;
                s.consume(*n);
            }
        });
    }
};

// Collects messages until a response arrives.
std::vector<json> until_response(UnixSocketClient& client) {
    std::vector<json> got;
    json msg;
    while (client.recv(msg, 1000)) {
        got.push_back(msg);
        if (msg["type"] == "response") break;
    }
    return got;
}

} // namespace

TEST_CASE("IPC end to end", "[ipc]") {
    auto sock_path = tmp_socket_path();
    std::filesystem::remove(sock_path);

    ServedCore daemon(sock_path);
    UnixSocketClient a;
    UnixSocketClient b;
    REQUIRE(a.connect(sock_path));
    daemon.accept();
    REQUIRE(b.connect(sock_path));
    daemon.accept();

    auto request = [&](UnixSocketClient& c, const std::string& command) {
        REQUIRE(c.send({{"command", command}, {"payload", json::object()}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        daemon.pump();
        return until_response(c);
    };

    SECTION("Ping") {
        auto got = request(a, "PING");
        REQUIRE(got.size() == 1);
        REQUIRE(got[0]["data"]["message"] == "PONG");
    }

    SECTION("EventPrecedesResponseAndReachesEveryone") {
        auto got = request(a, "START_RECORDING");
        REQUIRE(got.size() == 2);
        REQUIRE(got[0]["type"] == "event");
        REQUIRE(got[0]["state"]["phase"] == "recording");
        REQUIRE(got[1]["type"] == "response");
        REQUIRE(got[1]["state"]["sequence"] == got[0]["state"]["sequence"]);

        json seen;
        REQUIRE(b.recv(seen, 1000));
        REQUIRE(seen["type"] == "event");
        REQUIRE(seen["state"]["phase"] == "recording");
    }

    SECTION("TranscriptPushedToObserver") {
        request(a, "START_RECORDING");
        daemon.capture.feed(16000);
        request(a, "STOP_RECORDING");

        REQUIRE(wait_until([&] {
            daemon.core.on_worker_complete();
            return daemon.core.state().phase == Phase::Idle;
        }));
        daemon.flush();

        std::vector<json> events;
        json msg;
        while (events.size() < 3 && b.recv(msg, 1000)) events.push_back(msg);
        REQUIRE(events.size() == 3);
        REQUIRE(events[1]["state"]["phase"] == "transcribing");
        REQUIRE(events[2]["state"]["phase"] == "idle");
        REQUIRE(events[2]["data"]["text"] == "hello world");
    }

    SECTION("BadRequestKeepsConnection") {
        REQUIRE(a.send({{"command", "NOPE"}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        daemon.pump();
        auto got = until_response(a);
        REQUIRE(got.back()["error_type"] == "ProtocolError");

        REQUIRE(request(a, "PING").back()["status"] == "success");
    }

    std::filesystem::remove(sock_path);
}
