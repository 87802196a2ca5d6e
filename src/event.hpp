#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace engram {

// ── Raw host events ─────────────────────────────────────────────
// One value per observable host action. Consumed once by the capture
// filter and distiller, never persisted.

struct ToolUseEvent {
    std::string tool;
    nlohmann::json args = nlohmann::json::object();
    std::string result;
};

struct PhaseChangeEvent {
    std::optional<std::string> from;
    std::string to;
};

struct UserMessageEvent {
    std::string content;
};

struct AssistantMessageEvent {
    std::string content;
};

// Order matches EventKind.
using EventPayload = std::variant<ToolUseEvent, PhaseChangeEvent,
                                  UserMessageEvent, AssistantMessageEvent>;

enum class EventKind { ToolUse, PhaseChange, UserMessage, AssistantMessage };

struct RawEvent {
    uint64_t timestamp = 0;
    std::string session_id;
    EventPayload payload;

    EventKind kind() const { return static_cast<EventKind>(payload.index()); }
};

std::string event_kind_to_string(EventKind kind);

// ── Builders ────────────────────────────────────────────────────
// Stamp the current time. Tool results are capped at 2000 bytes and message
// bodies at 5000 bytes before they enter the pipeline.

RawEvent make_tool_event(const std::string& tool, nlohmann::json args,
                         const std::string& result, const std::string& session_id);

RawEvent make_phase_event(std::optional<std::string> from, const std::string& to,
                          const std::string& session_id);

RawEvent make_user_message(const std::string& content, const std::string& session_id);

RawEvent make_assistant_message(const std::string& content, const std::string& session_id);

// Decode a host event object:
//   {"type": "tool_use", "tool": ..., "args": {...}, "result": ...,
//    "timestamp": ..., "session_id": ...}
// Returns std::nullopt for unknown types or missing required fields.
std::optional<RawEvent> event_from_json(const nlohmann::json& j);

} // namespace engram
