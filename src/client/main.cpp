#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "status_tracker.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <utility>

using json = nlohmann::json;

namespace {

struct Options {
    std::string command;
    std::string text;
    std::string lang = "en";
    std::string updates;
    bool raw_json = false;
    int poll_ms = 5000;
    int timeout_s = 180;
};

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start                        Start recording");
    std::println(stderr, "  stop                         Stop recording and wait for the transcript");
    std::println(stderr, "  toggle                       Start or stop recording");
    std::println(stderr, "  status                       Show daemon status");
    std::println(stderr, "  process --text T             Refine text with the LLM");
    std::println(stderr, "  translate --text T --lang L  Translate text with the LLM");
    std::println(stderr, "  pause | resume | restart | shutdown | ping");
    std::println(stderr, "  config                       Show daemon configuration");
    std::println(stderr, "  set-config --set JSON        Merge JSON into the configuration");
    std::println(stderr, "  watch [--poll-ms N]          Follow state changes");
    std::println(stderr, "Options:");
    std::println(stderr, "  --json                       Print raw JSON messages");
    std::println(stderr, "  --timeout S                  Seconds to wait for a result (default 180)");
}

std::optional<json> build_request(const Options& opts) {
    static const std::pair<const char*, const char*> simple[] = {
        {"start", "START_RECORDING"}, {"stop", "STOP_RECORDING"},
        {"toggle", "TOGGLE_RECORDING"}, {"status", "GET_STATUS"},
        {"pause", "PAUSE"}, {"resume", "RESUME"}, {"restart", "RESTART"},
        {"shutdown", "SHUTDOWN"}, {"ping", "PING"}, {"config", "GET_CONFIG"},
    };
    for (auto& [name, wire] : simple) {
        if (opts.command == name) return json{{"command", wire}, {"payload", json::object()}};
    }

    if (opts.command == "process") {
        return json{{"command", "PROCESS_TEXT"}, {"payload", {{"text", opts.text}}}};
    }
    if (opts.command == "translate") {
        return json{{"command", "TRANSLATE_TEXT"},
                    {"payload", {{"text", opts.text}, {"target_lang", opts.lang}}}};
    }
    if (opts.command == "set-config") {
        auto updates = json::parse(opts.updates, nullptr, false);
        if (updates.is_discarded() || !updates.is_object()) {
            std::println(stderr, "--set must be a JSON object");
            return std::nullopt;
        }
        return json{{"command", "UPDATE_CONFIG"}, {"payload", {{"updates", updates}}}};
    }
    return std::nullopt;
}

std::string describe(const json& msg) {
    const auto& st = msg.value("state", json::object());
    return std::format("[#{}] {} -> {}", st.value("sequence", 0),
                       st.value("previous", std::string("?")), st.value("phase", std::string("?")));
}

// Waits for the event that ends `phase` (transcribing or processing).
int await_completion(UnixSocketClient& client, const std::string& phase, const Options& opts) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opts.timeout_s);

    while (std::chrono::steady_clock::now() < deadline) {
        json msg;
        if (!client.recv(msg, 1000)) {
            if (!client.connected()) {
                std::println(stderr, "Connection to daemon lost");
                return 1;
            }
            continue;
        }
        if (msg.value("type", "") != "event") continue;

        const auto& st = msg["state"];
        if (st.value("previous", "") != phase || st.value("phase", "") == phase) continue;

        if (opts.raw_json) {
            std::println("{}", msg.dump());
        } else if (msg.value("status", "") == "success") {
            const auto& data = msg.value("data", json::object());
            std::println("{}", data.is_object() ? data.value("text", std::string{}) : std::string{});
        } else {
            std::println(stderr, "Error ({}): {}", msg.value("error_type", std::string("?")),
                         msg.value("error", std::string("unknown error")));
            const auto& data = msg.value("data", json::object());
            if (data.is_object() && data.contains("text")) {
                std::println("{}", data["text"].get<std::string>());
            }
        }
        return msg.value("status", "") == "success" ? 0 : 1;
    }

    std::println(stderr, "Timed out waiting for {} to finish", phase);
    return 1;
}

int run_once(const Options& opts) {
    auto request = build_request(opts);
    if (!request) return 1;

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is v2md running?");
        return 1;
    }

    if (!client.send(*request)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // Events may arrive ahead of the response.
    json response;
    while (true) {
        if (!client.recv(response, 30000)) {
            std::println(stderr, "No response from daemon");
            return 1;
        }
        if (response.value("type", "") == "response") break;
    }

    if (opts.raw_json) {
        std::println("{}", response.dump());
    }

    if (response.value("status", "") != "success") {
        if (!opts.raw_json) {
            std::println(stderr, "Error ({}): {}", response.value("error_type", std::string("?")),
                         response.value("error", std::string("unknown error")));
        }
        return 1;
    }

    const auto& data = response["data"];
    auto phase = response["state"].value("phase", std::string{});

    if (phase == "transcribing" || phase == "processing") {
        if (opts.command == "stop" || opts.command == "toggle" ||
            opts.command == "process" || opts.command == "translate") {
            return await_completion(client, phase, opts);
        }
    }

    if (opts.raw_json) return 0;

    if (opts.command == "status") {
        std::println("State: {}", data.value("phase", std::string("unknown")));
        std::println("Sequence: {}", data.value("sequence", 0));
        if (data.value("recording", false)) {
            std::println("Recording duration: {:.1f}s", data.value("duration", 0.0));
        }
        std::println("Uptime: {:.0f}s", data.value("uptime", 0.0));
        std::println("Clients: {}", data.value("sessions", 0));
        auto last_error = response["state"]["last_error"];
        if (last_error.is_string()) {
            std::println("Last error: {}", last_error.get<std::string>());
        }
    } else if (opts.command == "config" || opts.command == "set-config") {
        std::println("{}", data.dump(2));
    } else if (data.is_object() && data.contains("message")) {
        std::println("{}", data["message"].get<std::string>());
    } else {
        std::println("OK");
    }
    return 0;
}

int run_watch(const Options& opts) {
    UnixSocketClient client;
    StatusTracker tracker;
    auto sock_path = platform::ipc_endpoint();
    const json status_request = {{"command", "GET_STATUS"}, {"payload", json::object()}};

    while (true) {
        if (!client.connected()) {
            if (!client.connect(sock_path)) {
                std::println(stderr, "Daemon not reachable at {}, retrying...", sock_path);
                std::this_thread::sleep_for(std::chrono::milliseconds(opts.poll_ms));
                continue;
            }
            // A restarted daemon starts counting from zero again.
            tracker.reset();
            if (!client.send(status_request)) continue;
        }

        auto next_poll = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.poll_ms);
        while (client.connected()) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                next_poll - std::chrono::steady_clock::now()).count();
            if (left <= 0) break;

            json msg;
            if (!client.recv(msg, static_cast<int>(left))) continue;

            bool fresh = tracker.observe(msg);
            if (opts.raw_json) {
                if (fresh) std::println("{}", msg.dump());
                continue;
            }
            if (!fresh) continue;

            if (msg.value("type", "") == "event") {
                std::string line = describe(msg);
                if (msg.value("status", "") == "error") {
                    line += " error: " + msg.value("error", std::string{});
                }
                const auto& data = msg["data"];
                if (data.is_object() && data.contains("text") && data["text"].is_string()) {
                    line += " text: " + data["text"].get<std::string>();
                }
                std::println("{}", line);
            } else {
                std::println("[#{}] {} (resync)", tracker.sequence().value_or(0), tracker.phase());
            }
        }

        if (client.connected() && !client.send(status_request)) {
            std::println(stderr, "Connection to daemon lost");
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    Options opts;
    opts.command = argv[1];

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 < argc) return argv[++i];
            std::println(stderr, "{} requires a value", arg);
            std::exit(1);
        };

        if (arg == "--text") {
            opts.text = value();
        } else if (arg == "--lang") {
            opts.lang = value();
        } else if (arg == "--set") {
            opts.updates = value();
        } else if (arg == "--poll-ms") {
            opts.poll_ms = std::max(100, std::atoi(value().c_str()));
        } else if (arg == "--timeout") {
            opts.timeout_s = std::max(1, std::atoi(value().c_str()));
        } else if (arg == "--json") {
            opts.raw_json = true;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (opts.command == "watch") {
        return run_watch(opts);
    }

    if (!build_request(opts)) {
        if (opts.command != "set-config") {
            std::println(stderr, "Unknown command: {}", opts.command);
            usage(argv[0]);
        }
        return 1;
    }
    return run_once(opts);
}
