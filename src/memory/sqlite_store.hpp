#pragma once
#include "../memory.hpp"
#include "database.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace engram {

struct StoreStats {
    uint32_t total = 0;
    std::map<std::string, uint32_t> by_type;
    uint32_t public_count = 0;
    uint32_t private_count = 0;
    uint64_t oldest = 0;
    uint64_t newest = 0;
};

// Record store: the memories table plus its FTS5 index.
class SqliteStore {
public:
    explicit SqliteStore(Database& db);

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Assigns id, stamps created/updated/accessed with now, access_count = 0.
    // Throws std::runtime_error when the row cannot be written.
    Memory insert(const MemoryInput& input);

    // All-or-nothing insert of several records.
    std::vector<Memory> insert_batch(const std::vector<MemoryInput>& inputs);

    // Point lookup that counts as an access.
    std::optional<Memory> get_by_id(int64_t id);

    // Point lookup without touching access statistics.
    std::optional<Memory> fetch(int64_t id) const;

    std::optional<Memory> update(int64_t id, const MemoryUpdate& changes);

    bool remove(int64_t id);

    // Ranked keyword search. score is the negated bm25 (higher = better).
    std::vector<SearchResult> search_fts(const std::string& query, uint32_t limit,
                                         const SearchFilters& filters) const;

    std::vector<Memory> get_recent(uint32_t limit, const std::vector<MemoryType>& types,
                                   bool include_private = false) const;
    std::vector<Memory> get_by_concepts(const std::vector<std::string>& concepts,
                                        uint32_t limit) const;
    std::vector<Memory> get_by_phase(const std::string& phase, uint32_t limit) const;
    std::vector<Memory> get_by_session(const std::string& session_id) const;

    // Every record, oldest first.
    std::vector<Memory> list_all() const;

    uint32_t count(const std::vector<MemoryType>& types = {}) const;
    StoreStats stats() const;

    // Bump accessed_at/access_count for the given ids.
    void touch(const std::vector<int64_t>& ids);

    // Delete rows with created_at < cutoff in batches of batch_size, each
    // batch in its own transaction. Returns rows removed.
    uint32_t delete_created_before(uint64_t cutoff, uint32_t batch_size = 500);

    // Delete by (importance ASC, created_at ASC, id ASC) until count <= max.
    uint32_t trim_to_max(uint32_t max, uint32_t batch_size = 500);

    // Merge FTS segments.
    void optimize();

    Database& database() { return db_; }

private:
    void init_schema();

    Database& db_;
};

// FTS5 MATCH expression for free text: quoted prefix terms, OR-joined.
// Empty when the text holds no searchable token.
std::string build_fts_query(const std::string& query);

} // namespace engram
