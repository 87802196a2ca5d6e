#include "context_builder.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>

namespace engram {

static constexpr uint32_t kDecisionHeadroomTokens = 200;
static constexpr uint32_t kRecentDecisions = 5;

static std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

static std::string fixed2(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

static std::string one_line(const std::string& s) {
    return replace_all(replace_all(s, "\r", " "), "\n", " ");
}

ContextBuilder::ContextBuilder(MemoryManager& memory, const InjectionConfig& config)
    : memory_(memory), config_(config) {}

ContextBuilder::Layout ContextBuilder::layout_for(const std::optional<std::string>& phase) const {
    Layout layout;
    switch (config_.format) {
        case InjectionFormat::Structured:
            layout.header = "<memory-context>\n";
            layout.footer = "</memory-context>";
            break;
        case InjectionFormat::Timeline:
            layout.header = "## Relevant Memories\n\n";
            layout.footer = "\n*Use memory_search for more context.*";
            break;
        case InjectionFormat::Bullets:
            layout.header = "**Context from Memory:**\n";
            layout.footer = "\n*Use memory_search for more context.*";
            break;
    }

    if (phase) {
        std::string open = "<memory-context phase=\"" + xml_escape(*phase) + "\">\n";
        if (config_.format == InjectionFormat::Structured) {
            layout.header = open;
        } else {
            layout.header = open + layout.header;
            layout.footer += "\n</memory-context>";
        }
    }
    return layout;
}

std::string ContextBuilder::format_entry(const Entry& entry) const {
    const auto& m = entry.memory;
    std::string type = memory_type_to_string(m.type);
    std::string date = format_date(m.created_at);

    switch (config_.format) {
        case InjectionFormat::Structured: {
            std::string out = "<memory type=\"" + type + "\" date=\"" + date +
                              "\" importance=\"" +
                              std::to_string(static_cast<int>(std::lround(m.importance * 10))) +
                              "\"";
            if (entry.score) out += " score=\"" + fixed2(*entry.score) + "\"";
            if (!m.facts.empty()) out += " facts=\"" + xml_escape(join(m.facts, "; ")) + "\"";
            out += ">\n";
            out += "<title>" + xml_escape(m.title) + "</title>\n";
            out += "<content>" + xml_escape(truncate_utf8(m.content, 200, "...")) +
                   "</content>\n";
            out += "</memory>\n";
            return out;
        }
        case InjectionFormat::Timeline: {
            std::string out = "### [" + type + "] " + m.title + "\n";
            out += "*" + date;
            if (entry.score) out += " | Score: " + fixed2(*entry.score);
            out += "*\n";
            out += truncate_utf8(m.content, 150, "...") + "\n\n";
            return out;
        }
        case InjectionFormat::Bullets:
            return "- **[" + type + "]** " + one_line(m.title) + " (" + date + "): " +
                   one_line(truncate_utf8(m.content, 100, "...")) + "\n";
    }
    return {};
}

std::string ContextBuilder::decisions_section(const std::vector<int64_t>& shown, size_t room) {
    auto decisions = memory_.get_recent(kRecentDecisions + static_cast<uint32_t>(shown.size()),
                                        {MemoryType::Decision});

    std::string open;
    std::string close;
    if (config_.format == InjectionFormat::Structured) {
        open = "<recent-decisions>\n";
        close = "</recent-decisions>\n";
    } else {
        open = "\n**Recent Decisions:**\n";
        close = "";
    }
    if (open.size() + close.size() >= room) return {};

    std::string body;
    uint32_t added = 0;
    for (const auto& d : decisions) {
        if (added >= kRecentDecisions) break;
        if (std::find(shown.begin(), shown.end(), d.id) != shown.end()) continue;

        std::string date = format_date(d.created_at);
        std::string line = config_.format == InjectionFormat::Structured
            ? "  <decision date=\"" + date + "\">" + xml_escape(d.title) + "</decision>\n"
            : "- " + one_line(d.title) + " (" + date + ")\n";
        if (open.size() + body.size() + line.size() + close.size() > room) break;
        body += line;
        ++added;
    }
    if (added == 0) return {};
    return open + body + close;
}

std::string ContextBuilder::render(const std::vector<Entry>& entries, const Layout& layout) {
    if (entries.empty()) return {};

    size_t budget_chars = static_cast<size_t>(config_.budget_tokens) * 4;
    size_t margin_tokens = std::min(config_.reserve_tokens, config_.budget_tokens / 4);
    size_t reserved = std::max(margin_tokens * 4, layout.footer.size());
    if (reserved >= budget_chars) return {};
    size_t entry_limit = budget_chars - reserved;

    std::string out = layout.header;
    if (out.size() >= entry_limit) return {};

    std::vector<int64_t> shown;
    for (const auto& entry : entries) {
        std::string piece = format_entry(entry);
        if (out.size() + piece.size() > entry_limit) break;
        out += piece;
        shown.push_back(entry.memory.id);
    }
    if (shown.empty()) return {};

    // Decisions get their own slice of whatever budget the entries left
    if (config_.include_decisions) {
        size_t room = budget_chars - layout.footer.size() - out.size();
        if (room >= static_cast<size_t>(kDecisionHeadroomTokens) * 4) {
            out += decisions_section(shown, room);
        }
    }

    out += layout.footer;
    return out;
}

std::string ContextBuilder::build_context(const std::string& query) {
    if (!config_.enabled || trim(query).empty()) return {};
    try {
        SearchOptions options;
        options.query = query;
        options.limit = config_.search_limit;
        options.types = config_.priority_types;

        std::vector<Entry> entries;
        for (auto& r : memory_.search(options)) {
            entries.push_back({std::move(r.memory), r.score});
        }
        return render(entries, layout_for(std::nullopt));
    } catch (const std::exception& e) {
        std::cerr << "[context] build_context failed: " << e.what() << "\n";
        return {};
    }
}

std::string ContextBuilder::build_recent_context(uint32_t limit) {
    if (!config_.enabled || limit == 0) return {};
    try {
        std::vector<Entry> entries;
        for (auto& m : memory_.get_recent(limit, {})) {
            entries.push_back({std::move(m), std::nullopt});
        }
        return render(entries, layout_for(std::nullopt));
    } catch (const std::exception& e) {
        std::cerr << "[context] build_recent_context failed: " << e.what() << "\n";
        return {};
    }
}

std::string ContextBuilder::build_phase_context(const std::string& phase) {
    if (!config_.enabled || trim(phase).empty()) return {};
    try {
        SearchOptions options;
        options.query = phase + " phase workflow";
        options.limit = config_.search_limit;

        std::vector<Entry> entries;
        for (auto& r : memory_.search(options)) {
            entries.push_back({std::move(r.memory), r.score});
        }
        return render(entries, layout_for(phase));
    } catch (const std::exception& e) {
        std::cerr << "[context] build_phase_context failed: " << e.what() << "\n";
        return {};
    }
}

} // namespace engram
