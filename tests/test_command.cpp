#include <catch2/catch_test_macros.hpp>

#include "command.hpp"

#include <nlohmann/json.hpp>
#include <variant>

using json = nlohmann::json;

TEST_CASE("parse_command", "[command]") {

    SECTION("SimpleCommand") {
        auto cmd = parse_command(3, R"({"command": "START_RECORDING", "payload": {}})");
        REQUIRE(cmd.has_value());
        REQUIRE(cmd->kind == CommandKind::StartRecording);
        REQUIRE(cmd->session == 3);
        REQUIRE(std::holds_alternative<NoPayload>(cmd->payload));
    }

    SECTION("PayloadOptional") {
        auto cmd = parse_command(1, R"({"command": "PING"})");
        REQUIRE(cmd.has_value());
        REQUIRE(cmd->kind == CommandKind::Ping);
    }

    SECTION("LegacyKeysAccepted") {
        auto cmd = parse_command(1, R"({"cmd": "PROCESS_TEXT", "data": {"text": "hi there"}})");
        REQUIRE(cmd.has_value());
        REQUIRE(cmd->kind == CommandKind::ProcessText);
        REQUIRE(std::get<TextPayload>(cmd->payload).text == "hi there");
    }

    SECTION("Aliases") {
        REQUIRE(parse_command(1, R"({"command": "PAUSE_DAEMON"})")->kind == CommandKind::Pause);
        REQUIRE(parse_command(1, R"({"command": "RESUME_DAEMON"})")->kind == CommandKind::Resume);
    }

    SECTION("TranslateNeedsTextAndLanguage") {
        auto ok = parse_command(1, R"({"command": "TRANSLATE_TEXT", "payload": {"text": "hola", "target_lang": "en"}})");
        REQUIRE(ok.has_value());
        auto& p = std::get<TranslatePayload>(ok->payload);
        REQUIRE(p.text == "hola");
        REQUIRE(p.target_lang == "en");

        auto missing = parse_command(1, R"({"command": "TRANSLATE_TEXT", "payload": {"text": "hola"}})");
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().kind == ErrorKind::Protocol);
        REQUIRE(missing.error().message.find("target_lang") != std::string::npos);
    }

    SECTION("UpdateConfigPayload") {
        auto cmd = parse_command(1, R"({"command": "UPDATE_CONFIG", "payload": {"updates": {"llm": {"model": "x"}}}})");
        REQUIRE(cmd.has_value());
        REQUIRE(std::get<ConfigUpdatePayload>(cmd->payload).updates["llm"]["model"] == "x");

        auto bad = parse_command(1, R"({"command": "UPDATE_CONFIG", "payload": {"updates": 5}})");
        REQUIRE_FALSE(bad.has_value());
    }

    SECTION("MalformedJson") {
        auto cmd = parse_command(1, "{not json");
        REQUIRE_FALSE(cmd.has_value());
        REQUIRE(cmd.error().kind == ErrorKind::Protocol);
        REQUIRE(cmd.error().message == "malformed JSON");
    }

    SECTION("NotAnObject") {
        REQUIRE(parse_command(1, "[1,2,3]").error().kind == ErrorKind::Protocol);
    }

    SECTION("MissingCommand") {
        auto cmd = parse_command(1, R"({"payload": {}})");
        REQUIRE_FALSE(cmd.has_value());
        REQUIRE(cmd.error().message == "missing 'command'");
    }

    SECTION("UnknownCommand") {
        auto cmd = parse_command(1, R"({"command": "MAKE_COFFEE"})");
        REQUIRE_FALSE(cmd.has_value());
        REQUIRE(cmd.error().message == "unknown command: MAKE_COFFEE");
    }

    SECTION("ProcessTextMissingOrEmptyText") {
        REQUIRE_FALSE(parse_command(1, R"({"command": "PROCESS_TEXT", "payload": {}})").has_value());
        REQUIRE_FALSE(parse_command(1, R"({"command": "PROCESS_TEXT", "payload": {"text": "  "}})").has_value());
        REQUIRE_FALSE(parse_command(1, R"({"command": "PROCESS_TEXT", "payload": {"text": 42}})").has_value());
    }

    SECTION("PayloadMustBeObject") {
        auto cmd = parse_command(1, R"({"command": "PING", "payload": "x"})");
        REQUIRE_FALSE(cmd.has_value());
        REQUIRE(cmd.error().kind == ErrorKind::Protocol);
    }

    SECTION("NamesRoundTrip") {
        for (auto name : {"START_RECORDING", "STOP_RECORDING", "TOGGLE_RECORDING", "GET_STATUS",
                          "PROCESS_TEXT", "TRANSLATE_TEXT", "PAUSE", "RESUME", "RESTART",
                          "SHUTDOWN", "PING", "GET_CONFIG", "UPDATE_CONFIG"}) {
            auto kind = command_from_name(name);
            REQUIRE(kind.has_value());
            REQUIRE(command_name(*kind) == name);
        }
    }
}
