#pragma once
#include "config.hpp"
#include "memory.hpp"
#include <optional>
#include <string>
#include <vector>

namespace engram {

// Renders memories as prompt-ready text under a token budget
// (estimate: ceil(chars / 4)). Never emits a partial entry; returns an
// empty string when nothing qualifies or the lookup fails.
class ContextBuilder {
public:
    ContextBuilder(MemoryManager& memory, const InjectionConfig& config);

    // Search-driven context over the configured priority types.
    std::string build_context(const std::string& query);

    // Most recent memories, for when no query is available.
    std::string build_recent_context(uint32_t limit);

    // Context for a workflow phase, wrapped in phase-tagged markup.
    std::string build_phase_context(const std::string& phase);

private:
    struct Entry {
        Memory memory;
        std::optional<double> score;
    };

    struct Layout {
        std::string header;
        std::string footer;
    };

    Layout layout_for(const std::optional<std::string>& phase) const;
    std::string format_entry(const Entry& entry) const;
    std::string render(const std::vector<Entry>& entries, const Layout& layout);
    std::string decisions_section(const std::vector<int64_t>& shown, size_t room);

    MemoryManager& memory_;
    InjectionConfig config_;
};

} // namespace engram
