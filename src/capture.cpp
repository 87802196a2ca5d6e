#include "capture.hpp"
#include <algorithm>
#include <unordered_map>

namespace engram {

static const std::unordered_map<std::string, int>& builtin_tool_importance() {
    static const std::unordered_map<std::string, int> table = {
        {"Write", 8},
        {"mcp_write", 8},
        {"Edit", 7},
        {"mcp_edit", 7},
        {"MultiEdit", 7},
        {"memory_decision", 8},
        {"NotebookEdit", 6},
        {"TodoWrite", 5},
        {"WebFetch", 4},
    };
    return table;
}

int tool_importance(const std::string& tool) {
    const auto& table = builtin_tool_importance();
    auto it = table.find(tool);
    return it != table.end() ? it->second : 5;
}

bool should_capture(const RawEvent& event, const CaptureConfig& config) {
    if (!config.enabled) return false;

    switch (event.kind()) {
        case EventKind::ToolUse: {
            if (!config.capture_tool_use) return false;
            const auto& tool = std::get<ToolUseEvent>(event.payload).tool;
            return std::find(config.skip_tools.begin(), config.skip_tools.end(), tool)
                   == config.skip_tools.end();
        }
        case EventKind::UserMessage:
        case EventKind::AssistantMessage:
            return config.capture_messages;
        case EventKind::PhaseChange:
            return config.capture_phase_changes;
    }
    return false;
}

int estimate_importance(const RawEvent& event, const CaptureConfig& config) {
    switch (event.kind()) {
        case EventKind::ToolUse: {
            const auto& tool = std::get<ToolUseEvent>(event.payload).tool;
            auto it = config.tool_importance.find(tool);
            if (it != config.tool_importance.end()) return it->second;
            return tool_importance(tool);
        }
        case EventKind::PhaseChange:
            return 7;
        case EventKind::UserMessage: {
            const auto& content = std::get<UserMessageEvent>(event.payload).content;
            if (content.find('?') != std::string::npos) return 6;
            if (!content.empty() && content[0] == '/') return 6;
            return 4;
        }
        case EventKind::AssistantMessage:
            return 3;
    }
    return 5;
}

MemoryType memory_type_for_event(const RawEvent& event) {
    switch (event.kind()) {
        case EventKind::ToolUse: {
            const auto& tool = std::get<ToolUseEvent>(event.payload).tool;
            if (tool.find("decision") != std::string::npos) return MemoryType::Decision;
            return MemoryType::Observation;
        }
        case EventKind::PhaseChange:      return MemoryType::SessionSummary;
        case EventKind::UserMessage:      return MemoryType::UserPrompt;
        case EventKind::AssistantMessage: return MemoryType::Observation;
    }
    return MemoryType::Observation;
}

} // namespace engram
