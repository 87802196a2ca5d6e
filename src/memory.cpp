#include "memory.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

namespace engram {

std::string memory_type_to_string(MemoryType type) {
    switch (type) {
        case MemoryType::Observation:    return "observation";
        case MemoryType::Decision:       return "decision";
        case MemoryType::SessionSummary: return "session_summary";
        case MemoryType::UserPrompt:     return "user_prompt";
        case MemoryType::Note:           return "note";
        case MemoryType::Todo:           return "todo";
    }
    return "observation";
}

std::optional<MemoryType> memory_type_from_string(const std::string& s) {
    if (s == "observation")     return MemoryType::Observation;
    if (s == "decision")        return MemoryType::Decision;
    if (s == "session_summary") return MemoryType::SessionSummary;
    if (s == "user_prompt")     return MemoryType::UserPrompt;
    if (s == "note")            return MemoryType::Note;
    if (s == "todo")            return MemoryType::Todo;
    return std::nullopt;
}

std::string visibility_to_string(Visibility v) {
    return v == Visibility::Private ? "private" : "public";
}

Visibility visibility_from_string(const std::string& s) {
    return s == "private" ? Visibility::Private : Visibility::Public;
}

std::string match_type_to_string(MatchType m) {
    switch (m) {
        case MatchType::Fts:    return "fts";
        case MatchType::Vector: return "vector";
        case MatchType::Hybrid: return "hybrid";
    }
    return "fts";
}

double canonicalize_importance(double importance) {
    if (std::isnan(importance)) return 0.5;
    if (importance > 1.0) importance /= 10.0;
    return std::clamp(importance, 0.0, 1.0);
}

bool SearchFilters::matches(const Memory& m) const {
    if (!types.empty() &&
        std::find(types.begin(), types.end(), m.type) == types.end()) {
        return false;
    }
    if (min_importance && m.importance < canonicalize_importance(*min_importance)) {
        return false;
    }
    if (!include_private && m.visibility == Visibility::Private) return false;
    if (phase && m.phase != phase) return false;
    return true;
}

SearchFilters filters_from_options(const SearchOptions& options) {
    SearchFilters f;
    f.types = options.types;
    f.min_importance = options.min_importance;
    f.include_private = options.include_private;
    f.phase = options.phase;
    return f;
}

std::string combine_for_embedding(const Memory& memory) {
    std::vector<std::string> parts;
    parts.push_back(memory.title);
    if (!memory.content.empty()) parts.push_back(memory.content);
    if (!memory.facts.empty()) parts.push_back("Facts: " + join(memory.facts, "; "));
    if (!memory.concepts.empty()) parts.push_back("Tags: " + join(memory.concepts, ", "));
    return join(parts, "\n\n");
}

} // namespace engram
