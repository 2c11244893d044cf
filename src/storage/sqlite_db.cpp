#include "foresight/storage/sqlite_db.hpp"

#include <filesystem>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace fs = std::filesystem;

namespace foresight::storage {

Database::Database(const std::string& path) : path_(path)
{
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StorageError("failed to open SQLite database at " + path + ": " + msg, rc);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 30000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA foreign_keys=ON;");
}

Database::~Database()
{
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void Database::exec(const std::string& sql)
{
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        throw StorageError("SQLite exec failed: " + msg, rc);
    }
}

Statement::Statement(const Database& db, const char* sql) : db_(db)
{
    int rc = sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("failed to prepare statement: ") + sqlite3_errmsg(db.handle()), rc);
    }
}

Statement::~Statement()
{
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement& Statement::bind(int idx, const std::string& value)
{
    sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, int64_t value)
{
    sqlite3_bind_int64(stmt_, idx, value);
    return *this;
}

Statement& Statement::bind(int idx, int value)
{
    sqlite3_bind_int(stmt_, idx, value);
    return *this;
}

Statement& Statement::bind(int idx, double value)
{
    sqlite3_bind_double(stmt_, idx, value);
    return *this;
}

Statement& Statement::bind(int idx, const std::optional<int>& value)
{
    if (value) {
        sqlite3_bind_int(stmt_, idx, *value);
    } else {
        sqlite3_bind_null(stmt_, idx);
    }
    return *this;
}

Statement& Statement::bind_null(int idx)
{
    sqlite3_bind_null(stmt_, idx);
    return *this;
}

bool Statement::step()
{
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StorageError(std::string("SQLite step failed: ") + sqlite3_errmsg(db_.handle()), rc);
}

int Statement::execute()
{
    int rc;
    do {
        rc = sqlite3_step(stmt_);
    } while (rc == SQLITE_ROW);

    if (rc == SQLITE_DONE || (rc & 0xFF) == SQLITE_CONSTRAINT) {
        return rc;
    }
    throw StorageError(std::string("SQLite step failed: ") + sqlite3_errmsg(db_.handle()), rc);
}

std::string Statement::column_text(int col) const
{
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

int64_t Statement::column_int64(int col) const
{
    return sqlite3_column_int64(stmt_, col);
}

int Statement::column_int(int col) const
{
    return sqlite3_column_int(stmt_, col);
}

double Statement::column_double(int col) const
{
    return sqlite3_column_double(stmt_, col);
}

bool Statement::column_is_null(int col) const
{
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

Transaction::Transaction(Database& db) : db_(db)
{
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction()
{
    if (!done_) {
        try {
            db_.exec("ROLLBACK;");
        } catch (const StorageError& e) {
            log::get()->error("Transaction rollback failed: {}", e.what());
        }
    }
}

void Transaction::commit()
{
    db_.exec("COMMIT;");
    done_ = true;
}

}  // namespace foresight::storage
