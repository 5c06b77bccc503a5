#include "sqlite_db.hpp"

#include <stdexcept>

SqliteDb::SqliteDb(const std::string& path, int flags)
{
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK)
    {
        std::string msg = "Failed to open SQLite DB: ";
        msg += path;
        if (db)
        {
            msg += " (";
            msg += sqlite3_errmsg(db);
            msg += ")";
            sqlite3_close(db);
            db = nullptr;
        }
        throw std::runtime_error(msg);
    }
}

SqliteDb::~SqliteDb()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

void SqliteDb::exec(const std::string& sql)
{
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK)
    {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

std::string SqliteDb::errorMessage() const
{
    return db ? sqlite3_errmsg(db) : "no database handle";
}

SqliteStmt::SqliteStmt(sqlite3* handle, const std::string& sql)
    : db(handle)
{
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::string msg = "Failed to prepare SQL: ";
        msg += sqlite3_errmsg(db);
        throw std::runtime_error(msg);
    }
}

SqliteStmt::~SqliteStmt()
{
    if (stmt)
    {
        sqlite3_finalize(stmt);
    }
}

void SqliteStmt::bindText(int index, const std::string& value)
{
    if (sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
    {
        std::string msg = "Failed to bind SQL parameter: ";
        msg += sqlite3_errmsg(db);
        throw std::runtime_error(msg);
    }
}

bool SqliteStmt::step(const char* what)
{
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)  return true;
    if (rc == SQLITE_DONE) return false;

    std::string msg = "SQLite step error while ";
    msg += what;
    msg += ": ";
    msg += sqlite3_errmsg(db);
    throw std::runtime_error(msg);
}

void SqliteStmt::reset()
{
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

std::optional<std::string> SqliteStmt::columnText(int col) const
{
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text)
        return std::nullopt;
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
}

long long SqliteStmt::columnInt64(int col) const
{
    return sqlite3_column_int64(stmt, col);
}
