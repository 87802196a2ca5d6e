#pragma once
#include <mutex>
#include <string>

struct sqlite3;      // forward declare
struct sqlite3_stmt; // forward declare

namespace engram {

// Owns one SQLite connection and the mutex that serializes access to it.
// Callers hold lock() for the duration of any statement sequence.
class Database {
public:
    // ":memory:" opens a private in-memory database.
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    std::unique_lock<std::mutex> lock() const {
        return std::unique_lock<std::mutex>(mutex_);
    }

    // Execute SQL, throwing std::runtime_error on failure.
    void exec(const std::string& sql);

    // Execute SQL, returning false (and logging) on failure.
    bool try_exec(const std::string& sql);

    std::string last_error() const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;

    StmtGuard() = default;
    ~StmtGuard();
    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;

    // Prepare sql; returns false when it does not compile.
    bool prepare(sqlite3* db, const std::string& sql);
};

// BEGIN IMMEDIATE on construction; ROLLBACK on destruction unless commit()
// succeeded. The caller must already hold the Database lock.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

} // namespace engram
