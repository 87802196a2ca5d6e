#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace engram {

std::string injection_format_to_string(InjectionFormat f) {
    switch (f) {
        case InjectionFormat::Structured: return "structured";
        case InjectionFormat::Timeline:   return "timeline";
        case InjectionFormat::Bullets:    return "bullets";
    }
    return "timeline";
}

std::optional<InjectionFormat> injection_format_from_string(const std::string& s) {
    if (s == "structured") return InjectionFormat::Structured;
    if (s == "timeline")   return InjectionFormat::Timeline;
    if (s == "bullets")    return InjectionFormat::Bullets;
    return std::nullopt;
}

nlohmann::json Config::defaults_json() {
    return {
        {"storage", {
            {"path", ""},
            {"sweep_batch_size", 500}
        }},
        {"capture", {
            {"enabled", true},
            {"capture_tool_use", true},
            {"capture_messages", false},
            {"capture_phase_changes", true},
            {"skip_tools", {"Read", "Glob", "Grep", "mcp_read", "mcp_glob", "mcp_grep",
                            "Bash", "mcp_bash", "memory_save", "memory_search",
                            "memory_note", "memory_decision", "memory_forget"}},
            {"min_importance_threshold", 4},
            {"tool_importance", nlohmann::json::object()}
        }},
        {"injection", {
            {"enabled", true},
            {"budget_tokens", 800},
            {"format", "timeline"},
            {"priority_types", {"decision", "observation", "todo"}},
            {"include_decisions", true},
            {"search_limit", 15},
            {"reserve_tokens", 100}
        }},
        {"privacy", {
            {"extra_patterns", nlohmann::json::array()},
            {"retention_days", 90},
            {"max_memories", 10000},
            {"max_content_chars", 10000}
        }},
        {"embeddings", {
            {"provider", "local"},
            {"model", ""},
            {"dimensions", 384},
            {"api_key", ""},
            {"base_url", ""}
        }},
        {"retrieval", {
            {"fts_weight", 0.4},
            {"vector_weight", 0.6},
            {"rrf_k", 60},
            {"reranking", false},
            {"vector_timeout_ms", 2000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Read an unsigned field constrained to [lo, hi]. Out-of-range values keep
// the default and log a warning.
static void read_bounded(const nlohmann::json& obj, const char* section, const char* key,
                         uint32_t lo, uint32_t hi, uint32_t& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_number_integer()) {
        std::cerr << "[config] " << section << "." << key
                  << " is not an integer, using default " << out << "\n";
        return;
    }
    auto n = v.get<int64_t>();
    if (n < static_cast<int64_t>(lo) || n > static_cast<int64_t>(hi)) {
        std::cerr << "[config] " << section << "." << key << "=" << n
                  << " outside [" << lo << ", " << hi << "], using default "
                  << out << "\n";
        return;
    }
    out = static_cast<uint32_t>(n);
}

// Fusion weights live in [0, 1]; out-of-range numbers are clamped.
static void read_weight(const nlohmann::json& obj, const char* section, const char* key,
                        double& out) {
    if (!obj.contains(key) || !obj[key].is_number()) return;
    double w = obj[key].get<double>();
    if (std::isnan(w)) return;
    double clamped = std::clamp(w, 0.0, 1.0);
    if (clamped != w) {
        std::cerr << "[config] " << section << "." << key << "=" << w
                  << " outside [0, 1], clamped to " << clamped << "\n";
    }
    out = clamped;
}

static std::vector<std::string> read_string_list(const nlohmann::json& arr) {
    std::vector<std::string> out;
    for (const auto& item : arr) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("storage") && j["storage"].is_object()) {
        auto& s = j["storage"];
        if (s.contains("path") && s["path"].is_string())
            cfg.storage.path = s["path"].get<std::string>();
        read_bounded(s, "storage", "sweep_batch_size", 1, 100000, cfg.storage.sweep_batch_size);
    }

    if (j.contains("capture") && j["capture"].is_object()) {
        auto& c = j["capture"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.capture.enabled = c["enabled"].get<bool>();
        if (c.contains("capture_tool_use") && c["capture_tool_use"].is_boolean())
            cfg.capture.capture_tool_use = c["capture_tool_use"].get<bool>();
        if (c.contains("capture_messages") && c["capture_messages"].is_boolean())
            cfg.capture.capture_messages = c["capture_messages"].get<bool>();
        if (c.contains("capture_phase_changes") && c["capture_phase_changes"].is_boolean())
            cfg.capture.capture_phase_changes = c["capture_phase_changes"].get<bool>();
        if (c.contains("skip_tools") && c["skip_tools"].is_array())
            cfg.capture.skip_tools = read_string_list(c["skip_tools"]);
        read_bounded(c, "capture", "min_importance_threshold", 1, 10,
                     cfg.capture.min_importance_threshold);
        if (c.contains("tool_importance") && c["tool_importance"].is_object()) {
            for (auto& [tool, score] : c["tool_importance"].items()) {
                if (score.is_number_integer()) {
                    int s = score.get<int>();
                    if (s >= 1 && s <= 10) cfg.capture.tool_importance[tool] = s;
                }
            }
        }
    }

    if (j.contains("injection") && j["injection"].is_object()) {
        auto& in = j["injection"];
        if (in.contains("enabled") && in["enabled"].is_boolean())
            cfg.injection.enabled = in["enabled"].get<bool>();
        read_bounded(in, "injection", "budget_tokens", 100, 4000, cfg.injection.budget_tokens);
        if (in.contains("format") && in["format"].is_string()) {
            auto name = in["format"].get<std::string>();
            if (auto f = injection_format_from_string(name)) {
                cfg.injection.format = *f;
            } else {
                std::cerr << "[config] Unknown injection.format '" << name
                          << "', using timeline\n";
            }
        }
        if (in.contains("priority_types") && in["priority_types"].is_array()) {
            std::vector<MemoryType> types;
            for (const auto& name : read_string_list(in["priority_types"])) {
                if (auto t = memory_type_from_string(name)) types.push_back(*t);
            }
            if (!types.empty()) cfg.injection.priority_types = types;
        }
        if (in.contains("include_decisions") && in["include_decisions"].is_boolean())
            cfg.injection.include_decisions = in["include_decisions"].get<bool>();
        read_bounded(in, "injection", "search_limit", 1, 50, cfg.injection.search_limit);
        read_bounded(in, "injection", "reserve_tokens", 0, 1000, cfg.injection.reserve_tokens);
    }

    if (j.contains("privacy") && j["privacy"].is_object()) {
        auto& p = j["privacy"];
        if (p.contains("extra_patterns") && p["extra_patterns"].is_array())
            cfg.privacy.extra_patterns = read_string_list(p["extra_patterns"]);
        read_bounded(p, "privacy", "retention_days", 1, 365, cfg.privacy.retention_days);
        read_bounded(p, "privacy", "max_memories", 100, 100000, cfg.privacy.max_memories);
        read_bounded(p, "privacy", "max_content_chars", 100, 100000,
                     cfg.privacy.max_content_chars);
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        if (e.contains("provider") && e["provider"].is_string())
            cfg.embeddings.provider = e["provider"].get<std::string>();
        if (e.contains("model") && e["model"].is_string())
            cfg.embeddings.model = e["model"].get<std::string>();
        read_bounded(e, "embeddings", "dimensions", 1, 4096, cfg.embeddings.dimensions);
        if (e.contains("api_key") && e["api_key"].is_string())
            cfg.embeddings.api_key = e["api_key"].get<std::string>();
        if (e.contains("base_url") && e["base_url"].is_string())
            cfg.embeddings.base_url = e["base_url"].get<std::string>();
    }

    if (j.contains("retrieval") && j["retrieval"].is_object()) {
        auto& r = j["retrieval"];
        read_weight(r, "retrieval", "fts_weight", cfg.retrieval.fts_weight);
        read_weight(r, "retrieval", "vector_weight", cfg.retrieval.vector_weight);
        read_bounded(r, "retrieval", "rrf_k", 1, 1000, cfg.retrieval.rrf_k);
        if (r.contains("reranking") && r["reranking"].is_boolean())
            cfg.retrieval.reranking = r["reranking"].get<bool>();
        read_bounded(r, "retrieval", "vector_timeout_ms", 1, 60000,
                     cfg.retrieval.vector_timeout_ms);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.engram/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("ENGRAM_DB_PATH"))
        cfg.storage.path = v;
    if (const char* v = std::getenv("ENGRAM_EMBEDDING_PROVIDER"))
        cfg.embeddings.provider = v;
    if (cfg.embeddings.api_key.empty()) {
        if (const char* v = std::getenv("OPENAI_API_KEY"))
            cfg.embeddings.api_key = v;
    }
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (cfg.embeddings.provider == "ollama") cfg.embeddings.base_url = v;
    }

    return cfg;
}

std::string Config::db_path() const {
    if (!storage.path.empty()) return expand_home(storage.path);
    return expand_home("~/.engram/memory.db");
}

} // namespace engram
