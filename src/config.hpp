#pragma once
#include "memory.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace engram {

// Startup misconfiguration that must stop the subsystem from starting.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StorageConfig {
    std::string path;                  // empty = ~/.engram/memory.db
    uint32_t sweep_batch_size = 500;   // rows per retention/trim transaction
};

struct CaptureConfig {
    bool enabled = true;
    bool capture_tool_use = true;
    bool capture_messages = false;
    bool capture_phase_changes = true;
    std::vector<std::string> skip_tools = {
        "Read", "Glob", "Grep", "mcp_read", "mcp_glob", "mcp_grep",
        "Bash", "mcp_bash",
        "memory_save", "memory_search", "memory_note", "memory_decision",
        "memory_forget"
    };
    uint32_t min_importance_threshold = 4;          // 1-10 scale
    std::unordered_map<std::string, int> tool_importance; // overrides built-in table
};

enum class InjectionFormat { Structured, Timeline, Bullets };

std::string injection_format_to_string(InjectionFormat f);
std::optional<InjectionFormat> injection_format_from_string(const std::string& s);

struct InjectionConfig {
    bool enabled = true;
    uint32_t budget_tokens = 800;
    InjectionFormat format = InjectionFormat::Timeline;
    std::vector<MemoryType> priority_types = {
        MemoryType::Decision, MemoryType::Observation, MemoryType::Todo
    };
    bool include_decisions = true;
    uint32_t search_limit = 15;
    uint32_t reserve_tokens = 100;   // kept free for header/footer
};

struct PrivacyConfig {
    std::vector<std::string> extra_patterns;
    uint32_t retention_days = 90;
    uint32_t max_memories = 10000;
    uint32_t max_content_chars = 10000;
};

struct EmbeddingsConfig {
    std::string provider = "local";   // local | openai | ollama | none
    std::string model;
    uint32_t dimensions = 384;
    std::string api_key;
    std::string base_url;
};

struct RetrievalConfig {
    double fts_weight = 0.4;
    double vector_weight = 0.6;
    uint32_t rrf_k = 60;
    bool reranking = false;
    uint32_t vector_timeout_ms = 2000;
};

struct Config {
    StorageConfig storage;
    CaptureConfig capture;
    InjectionConfig injection;
    PrivacyConfig privacy;
    EmbeddingsConfig embeddings;
    RetrievalConfig retrieval;

    // Load from ~/.engram/config.json + env vars
    static Config load();

    // Parse a config JSON object (no I/O, no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved database path
    std::string db_path() const;
};

} // namespace engram
