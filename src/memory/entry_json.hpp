#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>

namespace engram {

// JSON <-> Memory conversion used by snapshot export/import.

inline std::vector<std::string> string_array(const nlohmann::json& item, const char* key) {
    std::vector<std::string> out;
    if (item.contains(key) && item[key].is_array()) {
        for (const auto& v : item[key]) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

inline std::optional<std::string> optional_string(const nlohmann::json& item, const char* key) {
    if (item.contains(key) && item[key].is_string()) return item[key].get<std::string>();
    return std::nullopt;
}

inline Memory memory_from_json(const nlohmann::json& item) {
    Memory m;
    m.id = item.value("id", int64_t{0});
    m.type = memory_type_from_string(item.value("type", "observation"))
                 .value_or(MemoryType::Observation);
    m.title = item.value("title", "");
    m.content = item.value("content", "");
    m.facts = string_array(item, "facts");
    m.concepts = string_array(item, "concepts");
    m.source_files = string_array(item, "source_files");
    m.importance = canonicalize_importance(item.value("importance", 0.5));
    m.visibility = visibility_from_string(item.value("visibility", "public"));
    m.phase = optional_string(item, "phase");
    m.session_id = optional_string(item, "session_id");
    m.created_at = item.value("created_at", uint64_t{0});
    m.updated_at = item.value("updated_at", m.created_at);
    m.accessed_at = item.value("accessed_at", m.created_at);
    m.access_count = item.value("access_count", uint32_t{0});
    return m;
}

inline nlohmann::json memory_to_json(const Memory& m) {
    nlohmann::json item = {
        {"id", m.id},
        {"type", memory_type_to_string(m.type)},
        {"title", m.title},
        {"content", m.content},
        {"facts", m.facts},
        {"concepts", m.concepts},
        {"source_files", m.source_files},
        {"importance", m.importance},
        {"visibility", visibility_to_string(m.visibility)},
        {"created_at", m.created_at},
        {"updated_at", m.updated_at},
        {"accessed_at", m.accessed_at},
        {"access_count", m.access_count}
    };
    if (m.phase) item["phase"] = *m.phase;
    if (m.session_id) item["session_id"] = *m.session_id;
    return item;
}

} // namespace engram
