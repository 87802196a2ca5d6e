#include "sqlite_store.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <variant>

namespace engram {

namespace {

const char* const kColumns =
    "id, type, title, content, facts, concepts, source_files, importance,"
    " visibility, phase, session_id, created_at, updated_at, accessed_at, access_count";

const char* const kPrefixedColumns =
    "m.id, m.type, m.title, m.content, m.facts, m.concepts, m.source_files, m.importance,"
    " m.visibility, m.phase, m.session_id, m.created_at, m.updated_at, m.accessed_at,"
    " m.access_count";

constexpr int kColumnCount = 15;

using SqlParam = std::variant<int64_t, double, std::string>;

void bind_params(sqlite3_stmt* stmt, const std::vector<SqlParam>& params) {
    int col = 1;
    for (const auto& p : params) {
        if (auto* i = std::get_if<int64_t>(&p)) {
            sqlite3_bind_int64(stmt, col, *i);
        } else if (auto* d = std::get_if<double>(&p)) {
            sqlite3_bind_double(stmt, col, *d);
        } else {
            const auto& s = std::get<std::string>(p);
            sqlite3_bind_text(stmt, col, s.c_str(), -1, SQLITE_TRANSIENT);
        }
        ++col;
    }
}

void bind_optional_text(sqlite3_stmt* stmt, int col, const std::optional<std::string>& v) {
    if (v) {
        sqlite3_bind_text(stmt, col, v->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, col);
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

std::string encode_list(const std::vector<std::string>& items) {
    return nlohmann::json(items).dump();
}

std::vector<std::string> decode_list(const std::string& text) {
    std::vector<std::string> out;
    if (text.empty()) return out;
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_array()) return out;
        for (const auto& item : j) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[storage] Malformed list column: " << e.what() << "\n";
    }
    return out;
}

// Read a Memory from columns 0-14 (see kColumns).
Memory memory_from_stmt(sqlite3_stmt* stmt) {
    Memory m;
    m.id = sqlite3_column_int64(stmt, 0);
    m.type = memory_type_from_string(column_text(stmt, 1)).value_or(MemoryType::Observation);
    m.title = column_text(stmt, 2);
    m.content = column_text(stmt, 3);
    m.facts = decode_list(column_text(stmt, 4));
    m.concepts = decode_list(column_text(stmt, 5));
    m.source_files = decode_list(column_text(stmt, 6));
    m.importance = sqlite3_column_double(stmt, 7);
    m.visibility = visibility_from_string(column_text(stmt, 8));
    m.phase = column_optional_text(stmt, 9);
    m.session_id = column_optional_text(stmt, 10);
    m.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 11));
    m.updated_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 12));
    m.accessed_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 13));
    m.access_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 14));
    return m;
}

// Append WHERE-clause filters for the memories table (aliased by `alias`).
void append_filters(std::string& sql, std::vector<SqlParam>& params,
                    const SearchFilters& filters, const std::string& alias) {
    if (!filters.types.empty()) {
        sql += " AND " + alias + "type IN (";
        for (size_t i = 0; i < filters.types.size(); ++i) {
            if (i > 0) sql += ',';
            sql += '?';
            params.emplace_back(memory_type_to_string(filters.types[i]));
        }
        sql += ")";
    }
    if (filters.min_importance) {
        sql += " AND " + alias + "importance >= ?";
        params.emplace_back(canonicalize_importance(*filters.min_importance));
    }
    if (!filters.include_private) {
        sql += " AND " + alias + "visibility = 'public'";
    }
    if (filters.phase) {
        sql += " AND " + alias + "phase = ?";
        params.emplace_back(*filters.phase);
    }
}

std::vector<Memory> run_memory_query(sqlite3* db, const std::string& sql,
                                     const std::vector<SqlParam>& params) {
    StmtGuard g;
    if (!g.prepare(db, sql)) {
        std::cerr << "[storage] Query failed: " << sqlite3_errmsg(db) << "\n";
        return {};
    }
    bind_params(g.stmt, params);

    std::vector<Memory> results;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        results.push_back(memory_from_stmt(g.stmt));
    }
    return results;
}

std::optional<Memory> fetch_locked(sqlite3* db, int64_t id) {
    auto rows = run_memory_query(
        db, std::string("SELECT ") + kColumns + " FROM memories WHERE id = ?;", {id});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

Memory insert_locked(sqlite3* db, const MemoryInput& input) {
    auto now = static_cast<int64_t>(epoch_seconds());
    double importance = canonicalize_importance(input.importance);

    StmtGuard g;
    const char* sql =
        "INSERT INTO memories (type, title, content, facts, concepts, source_files,"
        " importance, visibility, phase, session_id, created_at, updated_at,"
        " accessed_at, access_count)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0);";
    if (!g.prepare(db, sql)) {
        throw std::runtime_error(std::string("SqliteStore: insert failed: ") +
                                 sqlite3_errmsg(db));
    }

    std::string type = memory_type_to_string(input.type);
    std::string facts = encode_list(input.facts);
    std::string concepts = encode_list(input.concepts);
    std::string files = encode_list(input.source_files);
    std::string visibility = visibility_to_string(input.visibility);

    sqlite3_bind_text(g.stmt, 1, type.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, input.title.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, input.content.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, facts.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, concepts.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 6, files.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(g.stmt, 7, importance);
    sqlite3_bind_text(g.stmt, 8, visibility.c_str(), -1, SQLITE_STATIC);
    bind_optional_text(g.stmt, 9, input.phase);
    bind_optional_text(g.stmt, 10, input.session_id);
    sqlite3_bind_int64(g.stmt, 11, now);
    sqlite3_bind_int64(g.stmt, 12, now);
    sqlite3_bind_int64(g.stmt, 13, now);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteStore: insert failed: ") +
                                 sqlite3_errmsg(db));
    }

    Memory m;
    m.id = sqlite3_last_insert_rowid(db);
    m.type = input.type;
    m.title = input.title;
    m.content = input.content;
    m.facts = input.facts;
    m.concepts = input.concepts;
    m.source_files = input.source_files;
    m.importance = importance;
    m.visibility = input.visibility;
    m.phase = input.phase;
    m.session_id = input.session_id;
    m.created_at = m.updated_at = m.accessed_at = static_cast<uint64_t>(now);
    m.access_count = 0;
    return m;
}

bool is_token_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || u >= 0x80;
}

// LIKE wildcards match literally under ESCAPE '\'.
std::string escape_like(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

} // namespace

std::string build_fts_query(const std::string& query) {
    std::vector<std::string> terms;
    std::string token;
    auto flush = [&]() {
        if (token.size() >= 2) terms.push_back("\"" + token + "\"*");
        token.clear();
    };
    for (char c : query) {
        if (is_token_char(c)) {
            token += c;
        } else {
            flush();
        }
    }
    flush();
    return join(terms, " OR ");
}

SqliteStore::SqliteStore(Database& db) : db_(db) {
    auto lock = db_.lock();
    init_schema();
}

void SqliteStore::init_schema() {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id           INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  type         TEXT NOT NULL DEFAULT 'observation',"
        "  title        TEXT NOT NULL,"
        "  content      TEXT NOT NULL,"
        "  facts        TEXT NOT NULL DEFAULT '[]',"
        "  concepts     TEXT NOT NULL DEFAULT '[]',"
        "  source_files TEXT NOT NULL DEFAULT '[]',"
        "  importance   REAL NOT NULL DEFAULT 0.5"
        "               CHECK (importance >= 0.0 AND importance <= 1.0),"
        "  visibility   TEXT NOT NULL DEFAULT 'public',"
        "  phase        TEXT,"
        "  session_id   TEXT,"
        "  created_at   INTEGER NOT NULL,"
        "  updated_at   INTEGER NOT NULL,"
        "  accessed_at  INTEGER NOT NULL,"
        "  access_count INTEGER NOT NULL DEFAULT 0"
        ");");

    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_type ON memories(type);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_importance ON memories(importance);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_created ON memories(created_at);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_phase ON memories(phase);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_visibility ON memories(visibility);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_session ON memories(session_id);");

    // FTS5 external-content table over the text columns
    db_.exec(
        "CREATE VIRTUAL TABLE IF NOT EXISTS memories_fts USING fts5("
        "  title, content, facts, concepts,"
        "  content='memories', content_rowid='id',"
        "  tokenize='porter unicode61 remove_diacritics 2',"
        "  prefix='2 3'"
        ");");

    // Triggers to keep FTS in sync with the memories table
    db_.exec(
        "CREATE TRIGGER IF NOT EXISTS memories_ai AFTER INSERT ON memories BEGIN"
        "  INSERT INTO memories_fts(rowid, title, content, facts, concepts)"
        "  VALUES (new.id, new.title, new.content, new.facts, new.concepts);"
        "END;");
    db_.exec(
        "CREATE TRIGGER IF NOT EXISTS memories_ad AFTER DELETE ON memories BEGIN"
        "  INSERT INTO memories_fts(memories_fts, rowid, title, content, facts, concepts)"
        "  VALUES ('delete', old.id, old.title, old.content, old.facts, old.concepts);"
        "END;");
    // Only text changes re-index; access bookkeeping leaves FTS alone
    db_.exec(
        "CREATE TRIGGER IF NOT EXISTS memories_au"
        " AFTER UPDATE OF title, content, facts, concepts ON memories BEGIN"
        "  INSERT INTO memories_fts(memories_fts, rowid, title, content, facts, concepts)"
        "  VALUES ('delete', old.id, old.title, old.content, old.facts, old.concepts);"
        "  INSERT INTO memories_fts(rowid, title, content, facts, concepts)"
        "  VALUES (new.id, new.title, new.content, new.facts, new.concepts);"
        "END;");

    db_.exec(
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "  version    INTEGER PRIMARY KEY,"
        "  applied_at INTEGER NOT NULL"
        ");");
    db_.exec("INSERT OR IGNORE INTO schema_version (version, applied_at)"
             " VALUES (1, CAST(strftime('%s','now') AS INTEGER));");
}

Memory SqliteStore::insert(const MemoryInput& input) {
    auto lock = db_.lock();
    return insert_locked(db_.handle(), input);
}

std::vector<Memory> SqliteStore::insert_batch(const std::vector<MemoryInput>& inputs) {
    if (inputs.empty()) return {};
    auto lock = db_.lock();
    Transaction txn(db_);
    std::vector<Memory> out;
    out.reserve(inputs.size());
    for (const auto& input : inputs) {
        out.push_back(insert_locked(db_.handle(), input));
    }
    txn.commit();
    return out;
}

std::optional<Memory> SqliteStore::get_by_id(int64_t id) {
    auto lock = db_.lock();
    auto m = fetch_locked(db_.handle(), id);
    if (!m) return std::nullopt;

    auto now = epoch_seconds();
    StmtGuard g;
    if (g.prepare(db_.handle(),
                  "UPDATE memories SET accessed_at = ?, access_count = access_count + 1"
                  " WHERE id = ?;")) {
        sqlite3_bind_int64(g.stmt, 1, static_cast<int64_t>(now));
        sqlite3_bind_int64(g.stmt, 2, id);
        if (sqlite3_step(g.stmt) == SQLITE_DONE) {
            m->accessed_at = now;
            m->access_count += 1;
        }
    }
    return m;
}

std::optional<Memory> SqliteStore::fetch(int64_t id) const {
    auto lock = db_.lock();
    return fetch_locked(db_.handle(), id);
}

std::optional<Memory> SqliteStore::update(int64_t id, const MemoryUpdate& changes) {
    auto lock = db_.lock();
    auto existing = fetch_locked(db_.handle(), id);
    if (!existing) return std::nullopt;

    Memory m = *existing;
    if (changes.type) m.type = *changes.type;
    if (changes.title) m.title = *changes.title;
    if (changes.content) m.content = *changes.content;
    if (changes.facts) m.facts = *changes.facts;
    if (changes.concepts) m.concepts = *changes.concepts;
    if (changes.source_files) m.source_files = *changes.source_files;
    if (changes.importance) m.importance = canonicalize_importance(*changes.importance);
    if (changes.visibility) m.visibility = *changes.visibility;
    if (changes.phase) m.phase = *changes.phase;
    m.updated_at = epoch_seconds();

    StmtGuard g;
    const char* sql =
        "UPDATE memories SET type = ?, title = ?, content = ?, facts = ?, concepts = ?,"
        " source_files = ?, importance = ?, visibility = ?, phase = ?, updated_at = ?"
        " WHERE id = ?;";
    if (!g.prepare(db_.handle(), sql)) {
        std::cerr << "[storage] Update failed: " << db_.last_error() << "\n";
        return std::nullopt;
    }
    std::string type = memory_type_to_string(m.type);
    std::string facts = encode_list(m.facts);
    std::string concepts = encode_list(m.concepts);
    std::string files = encode_list(m.source_files);
    std::string visibility = visibility_to_string(m.visibility);
    sqlite3_bind_text(g.stmt, 1, type.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, m.title.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, m.content.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, facts.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, concepts.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 6, files.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(g.stmt, 7, m.importance);
    sqlite3_bind_text(g.stmt, 8, visibility.c_str(), -1, SQLITE_STATIC);
    bind_optional_text(g.stmt, 9, m.phase);
    sqlite3_bind_int64(g.stmt, 10, static_cast<int64_t>(m.updated_at));
    sqlite3_bind_int64(g.stmt, 11, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[storage] Update failed: " << db_.last_error() << "\n";
        return std::nullopt;
    }
    return m;
}

bool SqliteStore::remove(int64_t id) {
    auto lock = db_.lock();
    StmtGuard g;
    if (!g.prepare(db_.handle(), "DELETE FROM memories WHERE id = ?;")) return false;
    sqlite3_bind_int64(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[storage] Delete failed: " << db_.last_error() << "\n";
        return false;
    }
    return sqlite3_changes(db_.handle()) > 0;
}

std::vector<SearchResult> SqliteStore::search_fts(const std::string& query, uint32_t limit,
                                                  const SearchFilters& filters) const {
    if (limit == 0 || trim(query).empty()) return {};
    auto lock = db_.lock();

    std::vector<SearchResult> results;
    std::string fts_query = build_fts_query(query);
    if (!fts_query.empty()) {
        std::string sql = std::string("SELECT ") + kPrefixedColumns +
            ", -bm25(memories_fts, 10.0, 5.0, 1.0, 1.0) AS score,"
            " snippet(memories_fts, 1, '**', '**', '...', 16)"
            " FROM memories_fts"
            " JOIN memories AS m ON memories_fts.rowid = m.id"
            " WHERE memories_fts MATCH ?";
        std::vector<SqlParam> params = {fts_query};
        append_filters(sql, params, filters, "m.");
        sql += " ORDER BY bm25(memories_fts, 10.0, 5.0, 1.0, 1.0), m.id LIMIT ?;";
        params.emplace_back(static_cast<int64_t>(limit));

        StmtGuard g;
        if (g.prepare(db_.handle(), sql)) {
            bind_params(g.stmt, params);
            while (sqlite3_step(g.stmt) == SQLITE_ROW) {
                SearchResult r;
                r.memory = memory_from_stmt(g.stmt);
                r.score = sqlite3_column_double(g.stmt, kColumnCount);
                r.match_type = MatchType::Fts;
                r.highlighted = column_text(g.stmt, kColumnCount + 1);
                results.push_back(std::move(r));
            }
        } else {
            std::cerr << "[storage] FTS query failed: " << db_.last_error() << "\n";
        }
    }

    if (!results.empty()) return results;

    // Substring fallback for text the tokenizer does not split the same way
    std::string like = "%" + escape_like(trim(query)) + "%";
    std::string sql = std::string("SELECT ") + kColumns +
        " FROM memories WHERE (title LIKE ? ESCAPE '\\' OR content LIKE ? ESCAPE '\\')";
    std::vector<SqlParam> params = {like, like};
    append_filters(sql, params, filters, "");
    sql += " ORDER BY created_at DESC, id DESC LIMIT ?;";
    params.emplace_back(static_cast<int64_t>(limit));

    for (auto& m : run_memory_query(db_.handle(), sql, params)) {
        SearchResult r;
        r.memory = std::move(m);
        r.match_type = MatchType::Fts;
        results.push_back(std::move(r));
    }
    return results;
}

std::vector<Memory> SqliteStore::get_recent(uint32_t limit,
                                            const std::vector<MemoryType>& types,
                                            bool include_private) const {
    if (limit == 0) return {};
    auto lock = db_.lock();
    SearchFilters filters;
    filters.types = types;
    filters.include_private = include_private;

    std::string sql = std::string("SELECT ") + kColumns + " FROM memories WHERE 1=1";
    std::vector<SqlParam> params;
    append_filters(sql, params, filters, "");
    sql += " ORDER BY created_at DESC, id DESC LIMIT ?;";
    params.emplace_back(static_cast<int64_t>(limit));
    return run_memory_query(db_.handle(), sql, params);
}

std::vector<Memory> SqliteStore::get_by_concepts(const std::vector<std::string>& concepts,
                                                 uint32_t limit) const {
    if (concepts.empty() || limit == 0) return {};
    auto lock = db_.lock();

    std::string sql = std::string("SELECT ") + kColumns +
        " FROM memories WHERE EXISTS ("
        "  SELECT 1 FROM json_each(memories.concepts) WHERE json_each.value IN (";
    std::vector<SqlParam> params;
    for (size_t i = 0; i < concepts.size(); ++i) {
        if (i > 0) sql += ',';
        sql += '?';
        params.emplace_back(concepts[i]);
    }
    sql += ")) ORDER BY importance DESC, created_at DESC, id DESC LIMIT ?;";
    params.emplace_back(static_cast<int64_t>(limit));
    return run_memory_query(db_.handle(), sql, params);
}

std::vector<Memory> SqliteStore::get_by_phase(const std::string& phase, uint32_t limit) const {
    if (limit == 0) return {};
    auto lock = db_.lock();
    std::string sql = std::string("SELECT ") + kColumns +
        " FROM memories WHERE phase = ? ORDER BY created_at DESC, id DESC LIMIT ?;";
    return run_memory_query(db_.handle(), sql, {phase, static_cast<int64_t>(limit)});
}

std::vector<Memory> SqliteStore::get_by_session(const std::string& session_id) const {
    auto lock = db_.lock();
    std::string sql = std::string("SELECT ") + kColumns +
        " FROM memories WHERE session_id = ? ORDER BY created_at ASC, id ASC;";
    return run_memory_query(db_.handle(), sql, {session_id});
}

std::vector<Memory> SqliteStore::list_all() const {
    auto lock = db_.lock();
    std::string sql = std::string("SELECT ") + kColumns +
        " FROM memories ORDER BY created_at ASC, id ASC;";
    return run_memory_query(db_.handle(), sql, {});
}

uint32_t SqliteStore::count(const std::vector<MemoryType>& types) const {
    auto lock = db_.lock();
    std::string sql = "SELECT COUNT(*) FROM memories";
    std::vector<SqlParam> params;
    if (!types.empty()) {
        sql += " WHERE type IN (";
        for (size_t i = 0; i < types.size(); ++i) {
            if (i > 0) sql += ',';
            sql += '?';
            params.emplace_back(memory_type_to_string(types[i]));
        }
        sql += ")";
    }
    sql += ";";

    StmtGuard g;
    if (!g.prepare(db_.handle(), sql)) return 0;
    bind_params(g.stmt, params);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
    }
    return 0;
}

StoreStats SqliteStore::stats() const {
    auto lock = db_.lock();
    StoreStats s;
    {
        StmtGuard g;
        if (g.prepare(db_.handle(), "SELECT type, COUNT(*) FROM memories GROUP BY type;")) {
            while (sqlite3_step(g.stmt) == SQLITE_ROW) {
                auto n = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 1));
                s.by_type[column_text(g.stmt, 0)] = n;
                s.total += n;
            }
        }
    }
    {
        StmtGuard g;
        if (g.prepare(db_.handle(),
                      "SELECT SUM(visibility = 'public'), SUM(visibility = 'private'),"
                      " MIN(created_at), MAX(created_at) FROM memories;")) {
            if (sqlite3_step(g.stmt) == SQLITE_ROW) {
                s.public_count = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
                s.private_count = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 1));
                s.oldest = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 2));
                s.newest = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
            }
        }
    }
    return s;
}

void SqliteStore::touch(const std::vector<int64_t>& ids) {
    if (ids.empty()) return;
    auto lock = db_.lock();
    auto now = static_cast<int64_t>(epoch_seconds());

    // Build single UPDATE with IN (...) clause
    std::string sql =
        "UPDATE memories SET accessed_at = ?, access_count = access_count + 1 WHERE id IN (";
    std::vector<SqlParam> params = {now};
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) sql += ',';
        sql += '?';
        params.emplace_back(ids[i]);
    }
    sql += ");";

    StmtGuard g;
    if (!g.prepare(db_.handle(), sql)) return;
    bind_params(g.stmt, params);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[storage] Access update failed: " << db_.last_error() << "\n";
    }
}

uint32_t SqliteStore::delete_created_before(uint64_t cutoff, uint32_t batch_size) {
    if (batch_size == 0) batch_size = 500;
    uint32_t total = 0;
    while (true) {
        auto lock = db_.lock();
        Transaction txn(db_);
        StmtGuard g;
        if (!g.prepare(db_.handle(),
                       "DELETE FROM memories WHERE id IN ("
                       "  SELECT id FROM memories WHERE created_at < ? ORDER BY id LIMIT ?);")) {
            throw std::runtime_error("SqliteStore: retention sweep failed: " + db_.last_error());
        }
        sqlite3_bind_int64(g.stmt, 1, static_cast<int64_t>(cutoff));
        sqlite3_bind_int64(g.stmt, 2, batch_size);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            throw std::runtime_error("SqliteStore: retention sweep failed: " + db_.last_error());
        }
        auto removed = static_cast<uint32_t>(sqlite3_changes(db_.handle()));
        txn.commit();
        total += removed;
        if (removed < batch_size) break;
    }
    return total;
}

uint32_t SqliteStore::trim_to_max(uint32_t max, uint32_t batch_size) {
    if (batch_size == 0) batch_size = 500;
    uint32_t total = 0;
    while (true) {
        auto lock = db_.lock();
        Transaction txn(db_);

        int64_t current = 0;
        {
            StmtGuard c;
            if (!c.prepare(db_.handle(), "SELECT COUNT(*) FROM memories;") ||
                sqlite3_step(c.stmt) != SQLITE_ROW) {
                throw std::runtime_error("SqliteStore: trim failed: " + db_.last_error());
            }
            current = sqlite3_column_int64(c.stmt, 0);
        }
        if (current <= static_cast<int64_t>(max)) {
            txn.commit();
            break;
        }

        int64_t excess = current - static_cast<int64_t>(max);
        int64_t n = std::min<int64_t>(excess, batch_size);
        StmtGuard g;
        if (!g.prepare(db_.handle(),
                       "DELETE FROM memories WHERE id IN ("
                       "  SELECT id FROM memories"
                       "  ORDER BY importance ASC, created_at ASC, id ASC LIMIT ?);")) {
            throw std::runtime_error("SqliteStore: trim failed: " + db_.last_error());
        }
        sqlite3_bind_int64(g.stmt, 1, n);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            throw std::runtime_error("SqliteStore: trim failed: " + db_.last_error());
        }
        auto removed = static_cast<uint32_t>(sqlite3_changes(db_.handle()));
        txn.commit();
        total += removed;
        if (removed == 0) break;
    }
    return total;
}

void SqliteStore::optimize() {
    auto lock = db_.lock();
    db_.try_exec("INSERT INTO memories_fts(memories_fts) VALUES('optimize');");
}

} // namespace engram
