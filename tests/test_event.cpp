#include <catch2/catch_test_macros.hpp>
#include "event.hpp"

using namespace engram;

TEST_CASE("make_tool_event: caps result and stamps time", "[event]") {
    auto ev = make_tool_event("Write", {{"file_path", "/a.cpp"}}, std::string(3000, 'x'), "s1");
    REQUIRE(ev.kind() == EventKind::ToolUse);
    REQUIRE(ev.session_id == "s1");
    REQUIRE(ev.timestamp > 0);
    const auto& tool = std::get<ToolUseEvent>(ev.payload);
    REQUIRE(tool.tool == "Write");
    REQUIRE(tool.result.size() == 2000);
    REQUIRE(tool.args["file_path"] == "/a.cpp");
}

TEST_CASE("make_tool_event: non-object args become empty object", "[event]") {
    auto ev = make_tool_event("Edit", nlohmann::json::array({1, 2}), "", "");
    REQUIRE(std::get<ToolUseEvent>(ev.payload).args.is_object());
    REQUIRE(std::get<ToolUseEvent>(ev.payload).args.empty());
}

TEST_CASE("make_user_message: caps body at 5000", "[event]") {
    auto ev = make_user_message(std::string(6000, 'q'), "");
    REQUIRE(ev.kind() == EventKind::UserMessage);
    REQUIRE(std::get<UserMessageEvent>(ev.payload).content.size() == 5000);
}

TEST_CASE("event_from_json: decodes each kind", "[event]") {
    auto tool = event_from_json(nlohmann::json::parse(
        R"({"type":"tool_use","tool":"Edit","args":{"path":"/x.py"},"result":"ok",
            "timestamp":1700000000,"session_id":"abc"})"));
    REQUIRE(tool.has_value());
    REQUIRE(tool->kind() == EventKind::ToolUse);
    REQUIRE(tool->timestamp == 1700000000ULL);
    REQUIRE(tool->session_id == "abc");

    auto phase = event_from_json(nlohmann::json::parse(
        R"({"type":"phase_change","from":"plan","to":"build"})"));
    REQUIRE(phase.has_value());
    REQUIRE(phase->kind() == EventKind::PhaseChange);
    REQUIRE(std::get<PhaseChangeEvent>(phase->payload).from == std::optional<std::string>("plan"));

    auto user = event_from_json(nlohmann::json::parse(
        R"({"type":"user_message","content":"hi?"})"));
    REQUIRE(user.has_value());
    REQUIRE(user->kind() == EventKind::UserMessage);

    auto reply = event_from_json(nlohmann::json::parse(
        R"({"type":"assistant_message","content":"done"})"));
    REQUIRE(reply.has_value());
    REQUIRE(reply->kind() == EventKind::AssistantMessage);
}

TEST_CASE("event_from_json: rejects unknown or incomplete events", "[event]") {
    REQUIRE_FALSE(event_from_json(nlohmann::json::parse(R"({"type":"telemetry"})")).has_value());
    REQUIRE_FALSE(event_from_json(nlohmann::json::parse(R"({"type":"tool_use"})")).has_value());
    REQUIRE_FALSE(event_from_json(nlohmann::json::parse(R"({"type":"phase_change"})")).has_value());
    REQUIRE_FALSE(event_from_json(nlohmann::json::parse(R"({"tool":"Edit"})")).has_value());
    REQUIRE_FALSE(event_from_json(nlohmann::json::array()).has_value());
}

TEST_CASE("event_kind_to_string: stable names", "[event]") {
    REQUIRE(event_kind_to_string(EventKind::ToolUse) == "tool_use");
    REQUIRE(event_kind_to_string(EventKind::PhaseChange) == "phase_change");
    REQUIRE(event_kind_to_string(EventKind::UserMessage) == "user_message");
    REQUIRE(event_kind_to_string(EventKind::AssistantMessage) == "assistant_message");
}
