#pragma once
#include "config.hpp"
#include "event.hpp"
#include "memory.hpp"

namespace engram {

// Accept/reject decision for a raw event. Pure; no I/O.
bool should_capture(const RawEvent& event, const CaptureConfig& config);

// Importance on the 1-10 human scale. Tool events use a lookup table
// (config.tool_importance first, then the built-in table, then 5).
int estimate_importance(const RawEvent& event, const CaptureConfig& config);

// Built-in table lookup for a tool name; 5 when unknown.
int tool_importance(const std::string& tool);

MemoryType memory_type_for_event(const RawEvent& event);

} // namespace engram
