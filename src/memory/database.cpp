#include "database.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace engram {

Database::Database(const std::string& path) : path_(path) {
    if (path_ != ":memory:") {
        // Ensure parent directory exists
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("Database: failed to open " + path_ + ": " + err);
    }

    sqlite3_busy_timeout(db_, 5000);

    // Performance pragmas; failures only cost speed
    try_exec("PRAGMA journal_mode=WAL;");
    try_exec("PRAGMA synchronous=NORMAL;");
    try_exec("PRAGMA temp_store=MEMORY;");
    // Allow FTS5 virtual table use inside triggers (required since SQLite 3.37)
    try_exec("PRAGMA trusted_schema=ON;");
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Database: " + msg);
    }
}

bool Database::try_exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[storage] " << (err ? err : "unknown error") << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database closed";
}

StmtGuard::~StmtGuard() {
    if (stmt) sqlite3_finalize(stmt);
}

bool StmtGuard::prepare(sqlite3* db, const std::string& sql) {
    if (stmt) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }
    return sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK;
}

Transaction::Transaction(Database& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (!done_ && sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::cerr << "[storage] Rollback failed: " << db_.last_error() << "\n";
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace engram
