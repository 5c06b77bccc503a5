#pragma once

#include <optional>
#include <string>

#include <sqlite3.h>

// ---------------------------
// RAII wrappers for sqlite3
// ---------------------------

struct SqliteDb
{
    sqlite3* db = nullptr;

    // flags: SQLITE_OPEN_READONLY, or SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE.
    explicit SqliteDb(const std::string& path, int flags = SQLITE_OPEN_READONLY);
    ~SqliteDb();

    SqliteDb(const SqliteDb&)            = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    // Runs one or more statements that return no rows we care about.
    // Throws std::runtime_error with the SQLite message on failure.
    void exec(const std::string& sql);

    std::string errorMessage() const;
};

struct SqliteStmt
{
    sqlite3*      db   = nullptr;
    sqlite3_stmt* stmt = nullptr;

    SqliteStmt(sqlite3* db, const std::string& sql);
    ~SqliteStmt();

    SqliteStmt(const SqliteStmt&)            = delete;
    SqliteStmt& operator=(const SqliteStmt&) = delete;

    // Parameters are 1-based, as in sqlite3_bind_*.
    void bindText(int index, const std::string& value);

    // Returns true for SQLITE_ROW, false for SQLITE_DONE, throws otherwise.
    // `what` names the operation in the error message.
    bool step(const char* what);

    void reset();

    std::optional<std::string> columnText(int col) const;
    long long columnInt64(int col) const;
};
