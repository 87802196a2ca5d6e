#pragma once
#include "config.hpp"
#include "distiller.hpp"
#include "embedder.hpp"
#include "event.hpp"
#include "memory.hpp"
#include "privacy.hpp"
#include "retrieval.hpp"
#include "memory/database.hpp"
#include "memory/embedding_queue.hpp"
#include "memory/sqlite_store.hpp"
#include "memory/vector_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

// The memory subsystem behind one database: capture, sanitize, store,
// embed in the background, and search.
class MemoryService : public MemoryManager {
public:
    // embedder may be nullptr (keyword-only) and must outlive the service.
    // Throws ConfigurationError when the embedder's dimensions differ from
    // the configured or persisted dimension, std::runtime_error when the
    // database cannot be opened.
    MemoryService(const Config& config, Embedder* embedder);
    ~MemoryService() override;

    MemoryService(const MemoryService&) = delete;
    MemoryService& operator=(const MemoryService&) = delete;

    Memory save(const MemoryInput& input) override;
    std::vector<SearchResult> search(const SearchOptions& options) override;
    std::optional<Memory> get_by_id(int64_t id) override;
    std::vector<Memory> get_recent(uint32_t limit,
                                   const std::vector<MemoryType>& types) override;
    std::optional<Memory> update(int64_t id, const MemoryUpdate& changes) override;
    bool remove(int64_t id) override;

    // Capture, distill and save one host event. Never throws.
    std::optional<Memory> ingest(const RawEvent& event);

    DistillationResult distill(const RawEvent& event) const;

    // impact: "high" | "medium" | anything else
    Memory save_decision(const std::string& title, const std::string& reasoning,
                         const std::vector<std::string>& alternatives,
                         const std::string& impact);

    std::vector<Memory> get_by_concepts(const std::vector<std::string>& concepts,
                                        uint32_t limit);
    std::vector<Memory> get_by_phase(const std::string& phase, uint32_t limit);
    std::vector<Memory> get_by_session(const std::string& session_id);

    // Retention, size ceiling, orphan vectors, FTS optimize.
    MaintenanceReport run_maintenance();

    // Queue memories that have no stored vector. Returns how many were queued.
    uint32_t backfill_embeddings(uint32_t limit);

    // Wait for queued embeddings. True when the queue drained in time.
    bool flush_embeddings(uint32_t timeout_ms);

    StoreStats stats() const;
    bool vectors_available() const { return vectors_.available(); }

    // JSON array of every memory, oldest first.
    std::string export_snapshot() const;

    // Insert memories from an exported snapshot as new records.
    // Returns the number imported; 0 when the JSON is invalid.
    uint32_t import_snapshot(const std::string& json_str);

private:
    MemoryInput prepare(const MemoryInput& input) const;
    void queue_embedding(int64_t id);

    Config config_;
    Embedder* embedder_;
    Database db_;
    SqliteStore store_;
    VectorStore vectors_;
    Sanitizer sanitizer_;
    Distiller distiller_;
    PrivacyManager privacy_;
    Retrieval retrieval_;
    std::unique_ptr<EmbeddingQueue> queue_;
};

} // namespace engram
