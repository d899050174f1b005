#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace tether {

// Thin RAII wrapper around a sqlite3 connection. Errors throw std::runtime_error.
class SqliteDB {
public:
    explicit SqliteDB(std::string path);
    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    // Execute a SQL string (pragmas, migrations, transaction control)
    void exec(const std::string& sql);

    // WAL, NORMAL sync, busy timeout
    void configure();

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

// Prepared statement that finalizes itself.
class SqliteStatement {
public:
    SqliteStatement(SqliteDB& db, const char* sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    void bind_text(int idx, const std::string& value);
    void bind_null(int idx);
    void bind_int64(int idx, int64_t value);

    // true while rows remain; throws on error
    bool step();
    // Runs a statement that returns no rows.
    void run();
    void reset();

    std::string column_text(int col) const;
    bool column_is_null(int col) const;
    int64_t column_int64(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE takes the write lock up front; rolls back unless committed.
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDB& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteDB& db_;
    bool done_ = false;
};

}
