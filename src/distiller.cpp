#include "distiller.hpp"
#include "capture.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace engram {

static constexpr size_t kMaxTitle = 100;
static constexpr size_t kMaxMessageContent = 2000;
static constexpr size_t kMinAssistantLength = 100;
static constexpr size_t kMaxFacts = 5;
static constexpr size_t kMaxConcepts = 5;
static constexpr size_t kMaxSourceFiles = 5;

static const char* const kPathArgs[] = {"filePath", "file_path", "file", "path", "notebook_path"};

static std::string string_arg(const nlohmann::json& args, const char* key) {
    if (args.is_object() && args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return {};
}

static std::string path_arg(const nlohmann::json& args) {
    for (const char* key : kPathArgs) {
        auto v = string_arg(args, key);
        if (!v.empty()) return v;
    }
    return {};
}

static std::string file_extension(const std::string& path) {
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return {};
    if (dot + 1 >= path.size()) return {};
    return to_lower(path.substr(dot + 1));
}

static void push_unique(std::vector<std::string>& out, const std::string& value, size_t cap) {
    if (value.empty() || out.size() >= cap) return;
    if (std::find(out.begin(), out.end(), value) == out.end()) out.push_back(value);
}

static bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool contains_word(const std::string& haystack, const std::string& word) {
    size_t pos = 0;
    while ((pos = haystack.find(word, pos)) != std::string::npos) {
        bool left = pos == 0 || !is_word_char(haystack[pos - 1]);
        size_t end = pos + word.size();
        bool right = end >= haystack.size() || !is_word_char(haystack[end]);
        if (left && right) return true;
        pos = end;
    }
    return false;
}

// ── Field extractors ─────────────────────────────────────────────

std::string tool_title(const std::string& tool, const nlohmann::json& args) {
    std::string title;
    if (tool == "Edit" || tool == "mcp_edit" || tool == "MultiEdit") {
        auto path = path_arg(args);
        title = "Edited " + (path.empty() ? std::string("file") : path);
    } else if (tool == "Write" || tool == "mcp_write") {
        auto path = path_arg(args);
        title = "Wrote " + (path.empty() ? std::string("file") : path);
    } else if (tool == "Bash" || tool == "mcp_bash") {
        auto cmd = string_arg(args, "command");
        title = "Ran: " + (cmd.empty() ? std::string("command") : truncate_utf8(cmd, 50));
    } else if (tool == "memory_decision") {
        auto what = string_arg(args, "decision");
        if (what.empty()) what = string_arg(args, "title");
        title = "Decision: " + (what.empty() ? std::string("unnamed") : what);
    } else {
        title = "Tool: " + tool;
    }
    return truncate_utf8(title, kMaxTitle);
}

std::string tool_content(const std::string& tool, const nlohmann::json& args,
                         const std::string& result) {
    static const char* const kBodyArgs[] = {
        "content", "new_string", "old_string", "newString", "oldString"
    };

    std::string out = "Tool: " + tool;

    std::vector<std::string> lines;
    if (args.is_object()) {
        for (auto& [key, value] : args.items()) {
            if (lines.size() >= 5) break;
            bool body = std::any_of(std::begin(kBodyArgs), std::end(kBodyArgs),
                                    [&](const char* k) { return key == k; });
            if (body) continue;
            std::string text = value.is_string() ? value.get<std::string>() : value.dump();
            lines.push_back("  " + key + ": " + truncate_utf8(text, 100, "..."));
        }
    }
    if (!lines.empty()) {
        out += "\nArguments:\n" + join(lines, "\n");
    }
    if (!result.empty()) {
        out += "\nResult: " + truncate_utf8(result, 500, "...");
    }
    return out;
}

std::vector<std::string> facts_from_tool_result(const std::string& tool,
                                                const std::string& result) {
    std::vector<std::string> facts;
    std::string lower = to_lower(result);
    if (tool == "Edit" || tool == "Write" || tool == "mcp_edit" || tool == "mcp_write" ||
        tool == "MultiEdit") {
        if (lower.find("success") != std::string::npos) {
            facts.push_back("File modification successful");
        }
    } else if (tool == "Bash" || tool == "mcp_bash") {
        if (lower.find("error") != std::string::npos) {
            facts.push_back("Command encountered an error");
        } else if (lower.find("success") != std::string::npos) {
            facts.push_back("Command completed successfully");
        }
    }
    return facts;
}

std::vector<std::string> concepts_from_tool(const std::string& tool,
                                            const nlohmann::json& args) {
    std::vector<std::string> concepts;
    std::string name = to_lower(tool);
    if (name.rfind("mcp_", 0) == 0) name = name.substr(4);
    push_unique(concepts, name, kMaxConcepts);
    push_unique(concepts, file_extension(path_arg(args)), kMaxConcepts);
    return concepts;
}

std::vector<std::string> source_files(const nlohmann::json& args, const std::string& text) {
    static const std::regex path_re(R"((?:/[\w.-]+)+\.\w+)");

    std::vector<std::string> files;
    push_unique(files, path_arg(args), kMaxSourceFiles);

    for (auto it = std::sregex_iterator(text.begin(), text.end(), path_re);
         it != std::sregex_iterator() && files.size() < kMaxSourceFiles; ++it) {
        push_unique(files, it->str(), kMaxSourceFiles);
    }
    return files;
}

std::string intent_title(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find_first_of(".!?\n", pos);
        std::string piece = trim(text.substr(pos, end == std::string::npos
                                                      ? std::string::npos : end - pos));
        if (!piece.empty()) return truncate_utf8(piece, kMaxTitle);
        if (end == std::string::npos) break;
        pos = end + 1;
    }
    return {};
}

std::vector<std::string> concepts_from_text(const std::string& text) {
    static const char* const kVocabulary[] = {
        "function", "class", "component", "api", "database", "test", "bug", "fix",
        "feature", "refactor", "performance", "security", "typescript", "javascript",
        "react", "node", "python", "cpp", "rust", "sql"
    };

    std::vector<std::string> concepts;
    std::string lower = to_lower(text);
    for (const char* word : kVocabulary) {
        if (contains_word(lower, word)) push_unique(concepts, word, kMaxConcepts);
    }
    for (const auto& file : source_files(nlohmann::json::object(), text)) {
        push_unique(concepts, file_extension(file), kMaxConcepts);
    }
    return concepts;
}

std::vector<std::string> facts_from_text(const std::string& text) {
    static const std::string kBullet = "\xE2\x80\xA2";

    std::vector<std::string> facts;
    for (const auto& raw : split(text, '\n')) {
        if (facts.size() >= kMaxFacts) break;
        std::string line = trim(raw);
        std::string item;
        if (line.size() > 1 && (line[0] == '-' || line[0] == '*') &&
            std::isspace(static_cast<unsigned char>(line[1]))) {
            item = trim(line.substr(1));
        } else if (line.rfind(kBullet, 0) == 0) {
            item = trim(line.substr(kBullet.size()));
        }
        if (!item.empty()) facts.push_back(item);
    }
    return facts;
}

// ── Per-kind extractors ──────────────────────────────────────────

// 1-10 capture score to the stored 0-1 scale.
static double from_score(int importance) {
    return std::clamp(importance, 1, 10) / 10.0;
}

MemoryInput distill_tool_use(const ToolUseEvent& event, int importance) {
    MemoryInput in;
    in.title = tool_title(event.tool, event.args);
    in.content = tool_content(event.tool, event.args, event.result);
    in.facts = facts_from_tool_result(event.tool, event.result);
    in.concepts = concepts_from_tool(event.tool, event.args);
    in.source_files = source_files(event.args, event.result);
    in.importance = from_score(importance);
    return in;
}

MemoryInput distill_phase_change(const PhaseChangeEvent& event, int importance) {
    std::string from_label = event.from.value_or("start");
    MemoryInput in;
    in.title = truncate_utf8("Workflow phase: " + from_label + " -> " + event.to, kMaxTitle);
    in.content = "Transitioned from " + event.from.value_or("initial") + " phase to " +
                 event.to + " phase.";
    in.facts = {"Entered " + event.to + " phase"};
    in.concepts = {"workflow", "phase"};
    push_unique(in.concepts, to_lower(event.to), kMaxConcepts);
    in.importance = from_score(importance);
    in.phase = event.to;
    return in;
}

MemoryInput distill_user_message(const UserMessageEvent& event, int importance) {
    MemoryInput in;
    in.title = intent_title(event.content);
    if (in.title.empty()) in.title = "User message";
    in.content = truncate_utf8(event.content, kMaxMessageContent, "...");
    in.facts = facts_from_text(event.content);
    in.concepts = concepts_from_text(event.content);
    in.source_files = source_files(nlohmann::json::object(), event.content);
    in.importance = from_score(importance);
    return in;
}

std::optional<MemoryInput> distill_assistant_message(const AssistantMessageEvent& event,
                                                     int importance) {
    if (trim(event.content).size() < kMinAssistantLength) return std::nullopt;

    MemoryInput in;
    in.title = intent_title(event.content);
    if (in.title.empty()) in.title = "Assistant response";
    in.content = truncate_utf8(event.content, kMaxMessageContent, "...");
    in.facts = facts_from_text(event.content);
    in.concepts = concepts_from_text(event.content);
    in.source_files = source_files(nlohmann::json::object(), event.content);
    in.importance = from_score(importance);
    return in;
}

// ── Distiller ────────────────────────────────────────────────────

Distiller::Distiller(const CaptureConfig& config, const Sanitizer& sanitizer)
    : config_(config), sanitizer_(sanitizer) {}

DistillationResult Distiller::distill(const RawEvent& event) const {
    DistillationResult result;

    if (!should_capture(event, config_)) {
        result.reason = "filtered by capture config (" + event_kind_to_string(event.kind()) + ")";
        return result;
    }

    int importance = estimate_importance(event, config_);
    if (importance < static_cast<int>(config_.min_importance_threshold)) {
        result.reason = "importance " + std::to_string(importance) + " below threshold " +
                        std::to_string(config_.min_importance_threshold);
        return result;
    }

    std::optional<MemoryInput> input;
    switch (event.kind()) {
        case EventKind::ToolUse:
            input = distill_tool_use(std::get<ToolUseEvent>(event.payload), importance);
            break;
        case EventKind::PhaseChange:
            input = distill_phase_change(std::get<PhaseChangeEvent>(event.payload), importance);
            break;
        case EventKind::UserMessage:
            input = distill_user_message(std::get<UserMessageEvent>(event.payload), importance);
            break;
        case EventKind::AssistantMessage:
            input = distill_assistant_message(
                std::get<AssistantMessageEvent>(event.payload), importance);
            break;
    }

    if (!input) {
        result.reason = "message too short to distill";
        return result;
    }

    input->type = memory_type_for_event(event);
    input->title = sanitizer_.sanitize(input->title);
    input->content = sanitizer_.sanitize(input->content);
    for (auto& fact : input->facts) fact = sanitizer_.sanitize(fact);
    if (!event.session_id.empty()) input->session_id = event.session_id;

    result.captured = true;
    result.memory = std::move(input);
    return result;
}

} // namespace engram
