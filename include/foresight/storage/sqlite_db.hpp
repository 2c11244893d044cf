#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace foresight::storage {

/**
 * @brief Owning SQLite connection
 *
 * Opened in serialized mode so one connection can be shared by the
 * evaluator's worker threads. WAL journaling and foreign keys are enabled
 * on open.
 */
class Database {
public:
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    // Run one or more statements without results; throws StorageError
    void exec(const std::string& sql);

    // Rows changed by the last statement on this connection
    int changes() const { return sqlite3_changes(db_); }

    // Holds the connection mutex so step() and changes()/errmsg() are read together
    class Lock {
    public:
        explicit Lock(const Database& db) : mutex_(sqlite3_db_mutex(db.handle())) { sqlite3_mutex_enter(mutex_); }
        ~Lock() { sqlite3_mutex_leave(mutex_); }
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

    private:
        sqlite3_mutex* mutex_;
    };

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

/**
 * @brief Prepared statement, finalized on destruction
 *
 * Bind indices are 1-based and column indices 0-based, as in the C API.
 */
class Statement {
public:
    Statement(const Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& value);
    Statement& bind(int idx, int64_t value);
    Statement& bind(int idx, int value);
    Statement& bind(int idx, double value);
    Statement& bind(int idx, const std::optional<int>& value);
    Statement& bind_null(int idx);

    // True while a row is available, false when done; throws StorageError
    bool step();

    // Runs to completion; returns the SQLite result code (SQLITE_DONE or a
    // constraint code) instead of throwing on SQLITE_CONSTRAINT
    int execute();

    std::string column_text(int col) const;
    int64_t column_int64(int col) const;
    int column_int(int col) const;
    double column_double(int col) const;
    bool column_is_null(int col) const;

private:
    const Database& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// RAII BEGIN IMMEDIATE / COMMIT; rolls back unless commit() was called
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

}  // namespace foresight::storage
