#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace engram;

// ── Defaults ─────────────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.capture.min_importance_threshold == 4);
    REQUIRE(cfg.injection.budget_tokens == 800);
    REQUIRE(cfg.injection.format == InjectionFormat::Timeline);
    REQUIRE(cfg.injection.reserve_tokens == 100);
    REQUIRE(cfg.privacy.retention_days == 90);
    REQUIRE(cfg.privacy.max_memories == 10000);
    REQUIRE(cfg.privacy.max_content_chars == 10000);
    REQUIRE(cfg.embeddings.provider == "local");
    REQUIRE(cfg.embeddings.dimensions == 384);
    REQUIRE(cfg.retrieval.rrf_k == 60);
    REQUIRE(cfg.retrieval.fts_weight == 0.4);
    REQUIRE(cfg.retrieval.vector_weight == 0.6);
    REQUIRE_FALSE(cfg.retrieval.reranking);
    REQUIRE(cfg.storage.sweep_batch_size == 500);
}

TEST_CASE("Config::from_json: defaults_json yields defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.capture.skip_tools == plain.capture.skip_tools);
    REQUIRE(cfg.injection.priority_types == plain.injection.priority_types);
    REQUIRE(cfg.embeddings.dimensions == plain.embeddings.dimensions);
    REQUIRE(cfg.retrieval.vector_timeout_ms == plain.retrieval.vector_timeout_ms);
}

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "storage": { "path": "/tmp/x.db", "sweep_batch_size": 50 },
        "capture": {
            "capture_messages": true,
            "skip_tools": ["Read"],
            "min_importance_threshold": 7,
            "tool_importance": { "Deploy": 9 }
        },
        "injection": { "budget_tokens": 400, "format": "bullets",
                       "priority_types": ["decision"] },
        "privacy": { "extra_patterns": ["INTERNAL-[0-9]+"], "retention_days": 30,
                     "max_memories": 500 },
        "embeddings": { "provider": "ollama", "model": "nomic-embed-text",
                        "dimensions": 768 },
        "retrieval": { "fts_weight": 0.5, "vector_weight": 0.5, "rrf_k": 30,
                       "reranking": true, "vector_timeout_ms": 500 }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.storage.path == "/tmp/x.db");
    REQUIRE(cfg.db_path() == "/tmp/x.db");
    REQUIRE(cfg.storage.sweep_batch_size == 50);
    REQUIRE(cfg.capture.capture_messages);
    REQUIRE(cfg.capture.skip_tools == std::vector<std::string>{"Read"});
    REQUIRE(cfg.capture.min_importance_threshold == 7);
    REQUIRE(cfg.capture.tool_importance.at("Deploy") == 9);
    REQUIRE(cfg.injection.budget_tokens == 400);
    REQUIRE(cfg.injection.format == InjectionFormat::Bullets);
    REQUIRE(cfg.injection.priority_types == std::vector<MemoryType>{MemoryType::Decision});
    REQUIRE(cfg.privacy.extra_patterns.size() == 1);
    REQUIRE(cfg.privacy.retention_days == 30);
    REQUIRE(cfg.privacy.max_memories == 500);
    REQUIRE(cfg.embeddings.provider == "ollama");
    REQUIRE(cfg.embeddings.model == "nomic-embed-text");
    REQUIRE(cfg.embeddings.dimensions == 768);
    REQUIRE(cfg.retrieval.fts_weight == 0.5);
    REQUIRE(cfg.retrieval.rrf_k == 30);
    REQUIRE(cfg.retrieval.reranking);
    REQUIRE(cfg.retrieval.vector_timeout_ms == 500);
}

TEST_CASE("Config::from_json: out-of-range values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "capture": { "min_importance_threshold": 11 },
        "injection": { "budget_tokens": 50, "format": "poetry" },
        "privacy": { "retention_days": 0, "max_memories": 5 },
        "embeddings": { "dimensions": 100000 }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.capture.min_importance_threshold == 4);
    REQUIRE(cfg.injection.budget_tokens == 800);
    REQUIRE(cfg.injection.format == InjectionFormat::Timeline);
    REQUIRE(cfg.privacy.retention_days == 90);
    REQUIRE(cfg.privacy.max_memories == 10000);
    REQUIRE(cfg.embeddings.dimensions == 384);
}

TEST_CASE("Config::from_json: fusion weights are clamped to [0, 1]", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "retrieval": { "fts_weight": -0.3, "vector_weight": 1.5 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.retrieval.fts_weight == 0.0);
    REQUIRE(cfg.retrieval.vector_weight == 1.0);
}

TEST_CASE("Config::from_json: max_content_chars ceiling", "[config]") {
    auto j = nlohmann::json::parse(R"({ "privacy": { "max_content_chars": 1000000 } })");
    REQUIRE(Config::from_json(j).privacy.max_content_chars == 10000);

    j = nlohmann::json::parse(R"({ "privacy": { "max_content_chars": 100000 } })");
    REQUIRE(Config::from_json(j).privacy.max_content_chars == 100000);
}

TEST_CASE("Config::from_json: wrong types are ignored", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "capture": { "enabled": "yes", "min_importance_threshold": "high" },
        "injection": "not an object"
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.capture.enabled);
    REQUIRE(cfg.capture.min_importance_threshold == 4);
    REQUIRE(cfg.injection.budget_tokens == 800);
}

TEST_CASE("injection_format: string conversion", "[config]") {
    REQUIRE(injection_format_to_string(InjectionFormat::Structured) == "structured");
    REQUIRE(injection_format_from_string("timeline") == InjectionFormat::Timeline);
    REQUIRE_FALSE(injection_format_from_string("xml").has_value());
}

// ── load() ───────────────────────────────────────────────────────

static std::string make_temp_dir() {
    std::string tmpl = "/tmp/engram_test_config_XXXXXX";
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("ENGRAM_DB_PATH");
        unsetenv("ENGRAM_EMBEDDING_PROVIDER");
        unsetenv("OPENAI_API_KEY");
        unsetenv("OLLAMA_BASE_URL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.engram/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.engram");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.embeddings.provider == "local");
    REQUIRE(cfg.db_path() == g.dir + "/.engram/memory.db");

    REQUIRE(std::filesystem::exists(g.config_path()));
    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);
    REQUIRE(j.contains("capture"));
    REQUIRE(j["injection"]["budget_tokens"] == 800);
    REQUIRE(j["retrieval"]["rrf_k"] == 60);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"injection": {"budget_tokens": 1200}})");
    Config cfg = Config::load();
    REQUIRE(cfg.injection.budget_tokens == 1200);

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);
    REQUIRE(j["injection"]["budget_tokens"] == 1200);
    REQUIRE(j["injection"]["format"] == "timeline");
    REQUIRE(j.contains("privacy"));
    REQUIRE(j["privacy"]["retention_days"] == 90);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("{ not json");
    Config cfg = Config::load();
    REQUIRE(cfg.injection.budget_tokens == 800);
    REQUIRE(cfg.embeddings.provider == "local");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"embeddings": {"provider": "local"}})");
    setenv("ENGRAM_DB_PATH", "/tmp/override.db", 1);
    setenv("ENGRAM_EMBEDDING_PROVIDER", "ollama", 1);
    setenv("OLLAMA_BASE_URL", "http://env:1234", 1);
    setenv("OPENAI_API_KEY", "sk-env", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.db_path() == "/tmp/override.db");
    REQUIRE(cfg.embeddings.provider == "ollama");
    REQUIRE(cfg.embeddings.base_url == "http://env:1234");
    REQUIRE(cfg.embeddings.api_key == "sk-env");

    unsetenv("ENGRAM_DB_PATH");
    unsetenv("ENGRAM_EMBEDDING_PROVIDER");
    unsetenv("OLLAMA_BASE_URL");
    unsetenv("OPENAI_API_KEY");
}

TEST_CASE("Config::load: file api_key wins over OPENAI_API_KEY", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"embeddings": {"provider": "openai", "api_key": "sk-file"}})");
    setenv("OPENAI_API_KEY", "sk-env", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.embeddings.api_key == "sk-file");

    unsetenv("OPENAI_API_KEY");
}
