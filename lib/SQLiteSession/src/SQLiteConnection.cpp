// file SQLiteConnection.cpp

#include "SQLiteSession/SQLiteConnection.hpp"

#include "SQLiteSession/SQLiteError.hpp"

#include <sqlite3.h>

SQLiteConnection::SQLiteConnection(const std::filesystem::path& databasePath, std::chrono::milliseconds busyTimeout)
    : _database(nullptr)
{
    const int openCode = sqlite3_open_v2(databasePath.c_str(), &_database, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (SQLITE_OK != openCode)
    {
        // sqlite3_open_v2 may hand back a handle even on failure; it must still be closed.
        const std::string detail = (nullptr != _database) ? sqlite3_errmsg(_database) : sqlite3_errstr(openCode);
        sqlite3_close(_database);
        throw SQLiteError(openCode, "Cannot open history database " + databasePath.string() + ": " + detail);
    }

    try
    {
        const int timeoutCode = sqlite3_busy_timeout(_database, static_cast<int>(busyTimeout.count()));
        if (SQLITE_OK != timeoutCode)
        {
            throw SQLiteError(timeoutCode, "Cannot set busy timeout on " + databasePath.string());
        }
        Execute("PRAGMA journal_mode=WAL;"
                "PRAGMA foreign_keys=ON;");
    }
    catch (const SQLiteError&)
    {
        sqlite3_close(_database);
        throw;
    }
}

SQLiteConnection::~SQLiteConnection()
{
    sqlite3_close(_database);
}

void SQLiteConnection::Execute(const std::string& sql)
{
    char* errorMessage = nullptr;
    const int resultCode = sqlite3_exec(_database, sql.c_str(), nullptr, nullptr, &errorMessage);
    if (SQLITE_OK != resultCode)
    {
        const std::string detail = (nullptr != errorMessage) ? errorMessage : sqlite3_errstr(resultCode);
        sqlite3_free(errorMessage);
        throw SQLiteError(resultCode, detail);
    }
}

SQLiteStatement SQLiteConnection::Prepare(const std::string& sql)
{
    sqlite3_stmt* statement = nullptr;
    const int resultCode = sqlite3_prepare_v2(_database, sql.c_str(), static_cast<int>(sql.size()), &statement, nullptr);
    if (SQLITE_OK != resultCode)
    {
        throw SQLiteError(resultCode, std::string("prepare: ") + sqlite3_errmsg(_database));
    }
    return SQLiteStatement(statement);
}

std::int64_t SQLiteConnection::LastInsertRowId() const
{
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(_database));
}

int SQLiteConnection::UserVersion()
{
    SQLiteStatement statement = Prepare("PRAGMA user_version;");
    return (true == statement.Step()) ? static_cast<int>(statement.Integer(0)) : 0;
}

void SQLiteConnection::SetUserVersion(int version)
{
    Execute("PRAGMA user_version=" + std::to_string(version) + ";");
}

SQLiteTransaction::SQLiteTransaction(SQLiteConnection& connection) : _connection(connection), _open(false)
{
    _connection.Execute("BEGIN IMMEDIATE;");
    _open = true;
}

SQLiteTransaction::~SQLiteTransaction()
{
    if (true == _open)
    {
        try
        {
            _connection.Execute("ROLLBACK;");
        }
        catch (const SQLiteError&)
        {
            // SQLite already rolled back on its own after the failed statement.
        }
    }
}

void SQLiteTransaction::Commit()
{
    _connection.Execute("COMMIT;");
    _open = false;
}
