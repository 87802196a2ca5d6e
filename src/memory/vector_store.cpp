#include "vector_store.hpp"
#include "../config.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

namespace engram {

DimensionMismatchError::DimensionMismatchError(uint32_t expected, size_t actual)
    : std::invalid_argument("embedding dimension mismatch: expected " +
                            std::to_string(expected) + ", got " + std::to_string(actual))
    , expected_(expected)
    , actual_(actual)
{}

std::string encode_embedding(const Embedding& v) {
    std::string blob(v.size() * sizeof(float), '\0');
    if (!v.empty()) std::memcpy(&blob[0], v.data(), blob.size());
    return blob;
}

Embedding decode_embedding(const void* data, size_t bytes) {
    if (!data || bytes == 0 || bytes % sizeof(float) != 0) return {};
    Embedding v(bytes / sizeof(float));
    std::memcpy(v.data(), data, bytes);
    return v;
}

double cosine_distance(const Embedding& a, const Embedding& b) {
    return 1.0 - cosine_similarity(a, b);
}

static Embedding read_embedding_blob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (bytes <= 0) return {};
    return decode_embedding(blob, static_cast<size_t>(bytes));
}

VectorStore::VectorStore(Database& db, uint32_t dimensions)
    : db_(db), dimensions_(dimensions) {
    if (dimensions_ == 0) return;

    auto lock = db_.lock();
    available_ =
        db_.try_exec("CREATE TABLE IF NOT EXISTS memory_vectors ("
                     "  memory_id INTEGER PRIMARY KEY,"
                     "  embedding BLOB NOT NULL"
                     ");") &&
        db_.try_exec("CREATE TABLE IF NOT EXISTS vector_meta ("
                     "  key   TEXT PRIMARY KEY,"
                     "  value TEXT NOT NULL"
                     ");") &&
        db_.try_exec("CREATE TRIGGER IF NOT EXISTS memory_vectors_ad"
                     " AFTER DELETE ON memories BEGIN"
                     "  DELETE FROM memory_vectors WHERE memory_id = old.id;"
                     "END;");
    if (!available_) {
        std::cerr << "[vector] Vector index unavailable, search will use FTS only\n";
        return;
    }

    // The index is bound to one dimension for its lifetime
    StmtGuard g;
    if (g.prepare(db_.handle(), "SELECT value FROM vector_meta WHERE key = 'dimensions';") &&
        sqlite3_step(g.stmt) == SQLITE_ROW) {
        std::string stored = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
        if (stored != std::to_string(dimensions_)) {
            throw ConfigurationError("vector index holds " + stored +
                                     "-dimension embeddings but " +
                                     std::to_string(dimensions_) + " are configured");
        }
    } else {
        db_.exec("INSERT OR REPLACE INTO vector_meta (key, value) VALUES ('dimensions', '" +
                 std::to_string(dimensions_) + "');");
    }
}

void VectorStore::check_dimensions(size_t actual) const {
    if (actual != dimensions_) throw DimensionMismatchError(dimensions_, actual);
}

static void upsert_locked(Database& db, int64_t memory_id, const Embedding& embedding) {
    {
        StmtGuard d;
        if (!d.prepare(db.handle(), "DELETE FROM memory_vectors WHERE memory_id = ?;")) {
            throw std::runtime_error("VectorStore: " + db.last_error());
        }
        sqlite3_bind_int64(d.stmt, 1, memory_id);
        if (sqlite3_step(d.stmt) != SQLITE_DONE) {
            throw std::runtime_error("VectorStore: " + db.last_error());
        }
    }

    std::string blob = encode_embedding(embedding);
    StmtGuard g;
    if (!g.prepare(db.handle(),
                   "INSERT INTO memory_vectors (memory_id, embedding) VALUES (?, ?);")) {
        throw std::runtime_error("VectorStore: " + db.last_error());
    }
    sqlite3_bind_int64(g.stmt, 1, memory_id);
    sqlite3_bind_blob(g.stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error("VectorStore: " + db.last_error());
    }
}

void VectorStore::store_embedding(int64_t memory_id, const Embedding& embedding) {
    if (!available_) return;
    check_dimensions(embedding.size());

    auto lock = db_.lock();
    Transaction txn(db_);
    upsert_locked(db_, memory_id, embedding);
    txn.commit();
}

void VectorStore::store_batch(const std::vector<std::pair<int64_t, Embedding>>& items) {
    if (!available_ || items.empty()) return;
    for (const auto& [id, emb] : items) check_dimensions(emb.size());

    auto lock = db_.lock();
    Transaction txn(db_);
    for (const auto& [id, emb] : items) upsert_locked(db_, id, emb);
    txn.commit();
}

std::vector<VectorHit> VectorStore::search_similar(const Embedding& query, uint32_t k) const {
    if (!available_ || k == 0) return {};
    check_dimensions(query.size());

    std::vector<VectorHit> hits;
    {
        auto lock = db_.lock();
        StmtGuard g;
        if (!g.prepare(db_.handle(), "SELECT memory_id, embedding FROM memory_vectors;")) {
            std::cerr << "[vector] Scan failed: " << db_.last_error() << "\n";
            return {};
        }
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            auto emb = read_embedding_blob(g.stmt, 1);
            if (emb.size() != dimensions_) continue;
            hits.push_back({sqlite3_column_int64(g.stmt, 0), cosine_distance(query, emb)});
        }
    }

    auto closer = [](const VectorHit& a, const VectorHit& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.memory_id < b.memory_id;
    };
    if (hits.size() > k) {
        std::partial_sort(hits.begin(), hits.begin() + k, hits.end(), closer);
        hits.resize(k);
    } else {
        std::sort(hits.begin(), hits.end(), closer);
    }
    return hits;
}

std::optional<Embedding> VectorStore::get_embedding(int64_t memory_id) const {
    if (!available_) return std::nullopt;
    auto lock = db_.lock();
    StmtGuard g;
    if (!g.prepare(db_.handle(), "SELECT embedding FROM memory_vectors WHERE memory_id = ?;")) {
        return std::nullopt;
    }
    sqlite3_bind_int64(g.stmt, 1, memory_id);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    auto emb = read_embedding_blob(g.stmt, 0);
    if (emb.empty()) return std::nullopt;
    return emb;
}

bool VectorStore::remove(int64_t memory_id) {
    if (!available_) return false;
    auto lock = db_.lock();
    StmtGuard g;
    if (!g.prepare(db_.handle(), "DELETE FROM memory_vectors WHERE memory_id = ?;")) {
        return false;
    }
    sqlite3_bind_int64(g.stmt, 1, memory_id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_.handle()) > 0;
}

bool VectorStore::has_embedding(int64_t memory_id) const {
    if (!available_) return false;
    auto lock = db_.lock();
    StmtGuard g;
    if (!g.prepare(db_.handle(), "SELECT 1 FROM memory_vectors WHERE memory_id = ?;")) {
        return false;
    }
    sqlite3_bind_int64(g.stmt, 1, memory_id);
    return sqlite3_step(g.stmt) == SQLITE_ROW;
}

uint32_t VectorStore::count() const {
    if (!available_) return 0;
    auto lock = db_.lock();
    StmtGuard g;
    if (!g.prepare(db_.handle(), "SELECT COUNT(*) FROM memory_vectors;")) return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

uint32_t VectorStore::clean_orphans() {
    if (!available_) return 0;
    auto lock = db_.lock();
    StmtGuard g;
    if (!g.prepare(db_.handle(),
                   "DELETE FROM memory_vectors"
                   " WHERE memory_id NOT IN (SELECT id FROM memories);")) {
        return 0;
    }
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[vector] Orphan cleanup failed: " << db_.last_error() << "\n";
        return 0;
    }
    return static_cast<uint32_t>(sqlite3_changes(db_.handle()));
}

std::vector<int64_t> VectorStore::find_missing(uint32_t limit) const {
    if (!available_ || limit == 0) return {};
    auto lock = db_.lock();
    StmtGuard g;
    if (!g.prepare(db_.handle(),
                   "SELECT m.id FROM memories AS m"
                   " LEFT JOIN memory_vectors AS v ON v.memory_id = m.id"
                   " WHERE v.memory_id IS NULL ORDER BY m.created_at ASC, m.id ASC LIMIT ?;")) {
        return {};
    }
    sqlite3_bind_int64(g.stmt, 1, limit);
    std::vector<int64_t> ids;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(g.stmt, 0));
    }
    return ids;
}

} // namespace engram
