#pragma once
#include "config.hpp"
#include "event.hpp"
#include "memory.hpp"
#include "privacy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace engram {

struct DistillationResult {
    bool captured = false;
    std::optional<MemoryInput> memory;
    std::string reason;   // set when captured == false
};

// Turns accepted raw events into storable records.
class Distiller {
public:
    Distiller(const CaptureConfig& config, const Sanitizer& sanitizer);

    DistillationResult distill(const RawEvent& event) const;

private:
    CaptureConfig config_;
    const Sanitizer& sanitizer_;
};

// ── Per-kind extractors (pure) ──────────────────────────────────
// Importance arguments are on the 1-10 scale. The memory type is assigned by
// Distiller::distill from the event kind.

MemoryInput distill_tool_use(const ToolUseEvent& event, int importance);
MemoryInput distill_phase_change(const PhaseChangeEvent& event, int importance);
MemoryInput distill_user_message(const UserMessageEvent& event, int importance);

// std::nullopt when the reply is too short to carry durable facts.
std::optional<MemoryInput> distill_assistant_message(const AssistantMessageEvent& event,
                                                     int importance);

// ── Field extractors (pure) ─────────────────────────────────────

std::string tool_title(const std::string& tool, const nlohmann::json& args);
std::string tool_content(const std::string& tool, const nlohmann::json& args,
                         const std::string& result);
std::vector<std::string> facts_from_tool_result(const std::string& tool,
                                                const std::string& result);
std::vector<std::string> concepts_from_tool(const std::string& tool,
                                            const nlohmann::json& args);

// Paths from structured args plus absolute paths found in text. Max 5, deduplicated.
std::vector<std::string> source_files(const nlohmann::json& args, const std::string& text);

// First sentence of the text, at most 100 bytes.
std::string intent_title(const std::string& text);

// Fixed-vocabulary keywords plus file extensions. Max 5.
std::vector<std::string> concepts_from_text(const std::string& text);

// Bullet lines ("-", "*", "•"). Max 5.
std::vector<std::string> facts_from_text(const std::string& text);

} // namespace engram
