#include "sqlite_db.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace tether {

static void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error(msg);
    }

    configure();
}

SqliteDB::~SqliteDB() {
    if (db_) sqlite3_close(db_);
}

void SqliteDB::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

void SqliteDB::configure() {
    // WAL lets the worker read while a batch outcome is being written
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
    exec("PRAGMA temp_store=MEMORY;");
}

// ---------------------------------------------------------------------------

SqliteStatement::SqliteStatement(SqliteDB& db, const char* sql) : db_(db.handle()) {
    throw_if(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, "sqlite prepare");
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void SqliteStatement::bind_text(int idx, const std::string& value) {
    throw_if(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
             db_, "sqlite bind");
}

void SqliteStatement::bind_null(int idx) {
    throw_if(sqlite3_bind_null(stmt_, idx), db_, "sqlite bind");
}

void SqliteStatement::bind_int64(int idx, int64_t value) {
    throw_if(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)), db_, "sqlite bind");
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
}

void SqliteStatement::run() {
    while (step()) {
    }
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::column_text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

bool SqliteStatement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

int64_t SqliteStatement::column_int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

// ---------------------------------------------------------------------------

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (!done_) {
        try {
            db_.exec("ROLLBACK;");
        } catch (const std::exception& e) {
            Logger::log(Logger::Level::ERROR, Logger::EventType::SYNC, "internal",
                        std::string("Outbox rollback failed: ") + e.what());
        }
    }
}

void SqliteTransaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

}
