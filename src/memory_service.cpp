#include "memory_service.hpp"
#include "util.hpp"
#include "memory/entry_json.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace engram {

static constexpr size_t kMaxTitle = 100;
static constexpr size_t kMaxConcept = 100;

// Cut a field before it reaches the redaction rules.
static std::string capped(const std::string& text, size_t max, const char* field) {
    if (text.size() <= max) return text;
    std::cerr << "[memory] " << field << " truncated from " << text.size() << " to "
              << max << " bytes\n";
    return truncate_utf8(text, max);
}

static Embedder* checked_embedder(const Config& config, Embedder* embedder) {
    if (embedder && embedder->dimensions() != config.embeddings.dimensions) {
        throw ConfigurationError(
            "Embedder '" + embedder->embedder_name() + "' produces " +
            std::to_string(embedder->dimensions()) + "-dimensional vectors, configured " +
            std::to_string(config.embeddings.dimensions));
    }
    return embedder;
}

MemoryService::MemoryService(const Config& config, Embedder* embedder)
    : config_(config),
      embedder_(checked_embedder(config, embedder)),
      db_(config.db_path()),
      store_(db_),
      vectors_(db_, embedder ? config.embeddings.dimensions : 0),
      sanitizer_(config.privacy),
      distiller_(config.capture, sanitizer_),
      privacy_(store_, config.privacy, config.storage.sweep_batch_size),
      retrieval_(store_, vectors_, vectors_.available() ? embedder : nullptr,
                 config.retrieval) {
    if (embedder_ && vectors_.available()) {
        queue_ = std::make_unique<EmbeddingQueue>(store_, vectors_, *embedder_);
    } else if (embedder_) {
        std::cerr << "[memory] Vector store unavailable; search is keyword-only\n";
    }
}

MemoryService::~MemoryService() {
    if (queue_) queue_->stop();
}

MemoryInput MemoryService::prepare(const MemoryInput& input) const {
    MemoryInput out = input;

    auto validated = sanitizer_.validate_for_storage(input.content);
    for (const auto& w : validated.warnings) {
        std::cerr << "[memory] " << w << "\n";
    }
    out.content = std::move(validated.content);

    out.title = trim(sanitizer_.sanitize(capped(input.title, kMaxTitle * 4, "Title")));
    if (out.title.empty()) out.title = intent_title(out.content);
    if (out.title.empty()) out.title = "Untitled";
    if (out.title.size() > kMaxTitle) {
        std::cerr << "[memory] Title truncated to " << kMaxTitle << " bytes\n";
        out.title = truncate_utf8(out.title, kMaxTitle);
    }

    const size_t max_fact = config_.privacy.max_content_chars;
    for (auto& fact : out.facts) fact = sanitizer_.sanitize(capped(fact, max_fact, "Fact"));
    for (auto& concept_name : out.concepts) {
        concept_name = sanitizer_.sanitize(capped(concept_name, kMaxConcept, "Concept"));
    }
    out.importance = canonicalize_importance(input.importance);
    return out;
}

void MemoryService::queue_embedding(int64_t id) {
    if (queue_) queue_->enqueue(id);
}

Memory MemoryService::save(const MemoryInput& input) {
    Memory memory = store_.insert(prepare(input));
    queue_embedding(memory.id);
    return memory;
}

std::vector<SearchResult> MemoryService::search(const SearchOptions& options) {
    return retrieval_.search(options);
}

std::optional<Memory> MemoryService::get_by_id(int64_t id) {
    return store_.get_by_id(id);
}

std::vector<Memory> MemoryService::get_recent(uint32_t limit,
                                              const std::vector<MemoryType>& types) {
    return retrieval_.get_recent(limit, types);
}

std::optional<Memory> MemoryService::update(int64_t id, const MemoryUpdate& changes) {
    MemoryUpdate clean = changes;
    if (changes.title) {
        std::string title =
            trim(sanitizer_.sanitize(capped(*changes.title, kMaxTitle * 4, "Title")));
        clean.title = title.empty() ? std::string("Untitled") : truncate_utf8(title, kMaxTitle);
    }
    if (changes.content) {
        auto validated = sanitizer_.validate_for_storage(*changes.content);
        for (const auto& w : validated.warnings) {
            std::cerr << "[memory] " << w << "\n";
        }
        clean.content = std::move(validated.content);
    }
    if (clean.facts) {
        const size_t max_fact = config_.privacy.max_content_chars;
        for (auto& fact : *clean.facts) {
            fact = sanitizer_.sanitize(capped(fact, max_fact, "Fact"));
        }
    }
    if (clean.concepts) {
        for (auto& c : *clean.concepts) {
            c = sanitizer_.sanitize(capped(c, kMaxConcept, "Concept"));
        }
    }
    if (changes.importance) clean.importance = canonicalize_importance(*changes.importance);

    auto updated = store_.update(id, clean);
    if (updated && clean.changes_text()) queue_embedding(id);
    return updated;
}

bool MemoryService::remove(int64_t id) {
    return store_.remove(id);
}

DistillationResult MemoryService::distill(const RawEvent& event) const {
    return distiller_.distill(event);
}

std::optional<Memory> MemoryService::ingest(const RawEvent& event) {
    try {
        auto result = distiller_.distill(event);
        if (!result.captured || !result.memory) return std::nullopt;
        return save(*result.memory);
    } catch (const std::exception& e) {
        std::cerr << "[memory] Failed to ingest " << event_kind_to_string(event.kind())
                  << " event: " << e.what() << "\n";
        return std::nullopt;
    }
}

Memory MemoryService::save_decision(const std::string& title, const std::string& reasoning,
                                    const std::vector<std::string>& alternatives,
                                    const std::string& impact) {
    MemoryInput input;
    input.type = MemoryType::Decision;
    input.title = title;
    input.content = reasoning;
    if (!alternatives.empty()) {
        input.content += "\n\nAlternatives considered:";
        for (const auto& alt : alternatives) input.content += "\n- " + alt;
        for (const auto& alt : alternatives) input.facts.push_back("Considered: " + alt);
    }
    input.concepts = {"decision"};

    std::string level = to_lower(impact);
    if (level == "high") input.importance = 0.9;
    else if (level == "medium") input.importance = 0.7;
    else input.importance = 0.5;

    return save(input);
}

std::vector<Memory> MemoryService::get_by_concepts(const std::vector<std::string>& concepts,
                                                   uint32_t limit) {
    return retrieval_.get_by_concepts(concepts, limit);
}

std::vector<Memory> MemoryService::get_by_phase(const std::string& phase, uint32_t limit) {
    return retrieval_.get_by_phase(phase, limit);
}

std::vector<Memory> MemoryService::get_by_session(const std::string& session_id) {
    return retrieval_.get_by_session(session_id);
}

MaintenanceReport MemoryService::run_maintenance() {
    MaintenanceReport report = privacy_.run_maintenance();
    uint32_t orphans = vectors_.clean_orphans();
    store_.optimize();
    if (report.expired || report.trimmed || orphans) {
        std::cerr << "[memory] Maintenance: " << report.expired << " expired, "
                  << report.trimmed << " trimmed, " << orphans << " orphan vectors\n";
    }
    return report;
}

uint32_t MemoryService::backfill_embeddings(uint32_t limit) {
    if (!queue_) return 0;
    auto missing = vectors_.find_missing(limit);
    for (int64_t id : missing) queue_->enqueue(id);
    return static_cast<uint32_t>(missing.size());
}

bool MemoryService::flush_embeddings(uint32_t timeout_ms) {
    if (!queue_) return true;
    return queue_->wait_idle(timeout_ms);
}

StoreStats MemoryService::stats() const {
    return store_.stats();
}

std::string MemoryService::export_snapshot() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : store_.list_all()) {
        arr.push_back(memory_to_json(m));
    }
    return arr.dump(2);
}

uint32_t MemoryService::import_snapshot(const std::string& json_str) {
    std::vector<MemoryInput> inputs;
    try {
        nlohmann::json j = nlohmann::json::parse(json_str);
        if (!j.is_array()) return 0;

        for (const auto& item : j) {
            if (!item.is_object()) continue;
            Memory m = memory_from_json(item);
            if (m.title.empty() && m.content.empty()) continue;

            MemoryInput in;
            in.type = m.type;
            in.title = m.title;
            in.content = m.content;
            in.facts = m.facts;
            in.concepts = m.concepts;
            in.source_files = m.source_files;
            in.importance = m.importance;
            in.visibility = m.visibility;
            in.phase = m.phase;
            in.session_id = m.session_id;
            inputs.push_back(prepare(in));
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[memory] Snapshot import failed: " << e.what() << "\n";
        return 0;
    }

    auto saved = store_.insert_batch(inputs);
    for (const auto& m : saved) queue_embedding(m.id);
    return static_cast<uint32_t>(saved.size());
}

} // namespace engram
