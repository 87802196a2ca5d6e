#include "event.hpp"
#include "util.hpp"

namespace engram {

static constexpr size_t kMaxToolResult = 2000;
static constexpr size_t kMaxMessage = 5000;

std::string event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::ToolUse:          return "tool_use";
        case EventKind::PhaseChange:      return "phase_change";
        case EventKind::UserMessage:      return "user_message";
        case EventKind::AssistantMessage: return "assistant_message";
    }
    return "tool_use";
}

RawEvent make_tool_event(const std::string& tool, nlohmann::json args,
                         const std::string& result, const std::string& session_id) {
    RawEvent ev;
    ev.timestamp = epoch_seconds();
    ev.session_id = session_id;
    if (!args.is_object()) args = nlohmann::json::object();
    ev.payload = ToolUseEvent{tool, std::move(args), truncate_utf8(result, kMaxToolResult)};
    return ev;
}

RawEvent make_phase_event(std::optional<std::string> from, const std::string& to,
                          const std::string& session_id) {
    RawEvent ev;
    ev.timestamp = epoch_seconds();
    ev.session_id = session_id;
    ev.payload = PhaseChangeEvent{std::move(from), to};
    return ev;
}

RawEvent make_user_message(const std::string& content, const std::string& session_id) {
    RawEvent ev;
    ev.timestamp = epoch_seconds();
    ev.session_id = session_id;
    ev.payload = UserMessageEvent{truncate_utf8(content, kMaxMessage)};
    return ev;
}

RawEvent make_assistant_message(const std::string& content, const std::string& session_id) {
    RawEvent ev;
    ev.timestamp = epoch_seconds();
    ev.session_id = session_id;
    ev.payload = AssistantMessageEvent{truncate_utf8(content, kMaxMessage)};
    return ev;
}

static std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

std::optional<RawEvent> event_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return std::nullopt;
    }
    std::string type = j["type"].get<std::string>();
    std::string session = string_field(j, "session_id");

    RawEvent ev;
    if (type == "tool_use") {
        std::string tool = string_field(j, "tool");
        if (tool.empty()) return std::nullopt;
        nlohmann::json args = j.contains("args") ? j["args"] : nlohmann::json::object();
        ev = make_tool_event(tool, std::move(args), string_field(j, "result"), session);
    } else if (type == "phase_change") {
        std::string to = string_field(j, "to");
        if (to.empty()) return std::nullopt;
        std::optional<std::string> from;
        if (j.contains("from") && j["from"].is_string()) from = j["from"].get<std::string>();
        ev = make_phase_event(std::move(from), to, session);
    } else if (type == "user_message") {
        ev = make_user_message(string_field(j, "content"), session);
    } else if (type == "assistant_message") {
        ev = make_assistant_message(string_field(j, "content"), session);
    } else {
        return std::nullopt;
    }

    if (j.contains("timestamp") && j["timestamp"].is_number_unsigned()) {
        ev.timestamp = j["timestamp"].get<uint64_t>();
    }
    return ev;
}

} // namespace engram
