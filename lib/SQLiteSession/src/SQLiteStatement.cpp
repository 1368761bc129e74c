// file SQLiteStatement.cpp

#include "SQLiteSession/SQLiteStatement.hpp"

#include "SQLiteSession/SQLiteError.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <utility>

namespace
{
SQLiteError StatementError(sqlite3_stmt* statement, int resultCode, const char* action)
{
    sqlite3* database = sqlite3_db_handle(statement);
    const std::string detail = (nullptr != database) ? sqlite3_errmsg(database) : sqlite3_errstr(resultCode);
    return SQLiteError(resultCode, std::string(action) + ": " + detail);
}
}

SQLiteStatement::SQLiteStatement(sqlite3_stmt* statement) : _handle(statement)
{
    if (nullptr == _handle)
    {
        throw std::invalid_argument("Prepared statement handle is null");
    }
}

SQLiteStatement::~SQLiteStatement()
{
    sqlite3_finalize(_handle);
}

SQLiteStatement::SQLiteStatement(SQLiteStatement&& other) noexcept : _handle(std::exchange(other._handle, nullptr))
{
}

SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& other) noexcept
{
    if (this != &other)
    {
        sqlite3_finalize(_handle);
        _handle = std::exchange(other._handle, nullptr);
    }
    return *this;
}

void SQLiteStatement::Bind(int position, const std::string& value)
{
    const int resultCode = sqlite3_bind_text(_handle, position, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (SQLITE_OK != resultCode)
    {
        throw StatementError(_handle, resultCode, "bind text");
    }
}

void SQLiteStatement::Bind(int position, std::int64_t value)
{
    const int resultCode = sqlite3_bind_int64(_handle, position, static_cast<sqlite3_int64>(value));
    if (SQLITE_OK != resultCode)
    {
        throw StatementError(_handle, resultCode, "bind integer");
    }
}

bool SQLiteStatement::Step()
{
    const int resultCode = sqlite3_step(_handle);
    switch (resultCode)
    {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default:
            throw StatementError(_handle, resultCode, "step");
    }
}

void SQLiteStatement::Run()
{
    if (true == Step())
    {
        throw SQLiteError(SQLITE_MISUSE, "Statement returned rows where none were expected");
    }
}

void SQLiteStatement::Reset() noexcept
{
    // The step error, if any, was already reported by Step().
    sqlite3_reset(_handle);
    sqlite3_clear_bindings(_handle);
}

std::string SQLiteStatement::Text(int column) const
{
    const auto* value = sqlite3_column_text(_handle, column);
    if (nullptr == value)
    {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(value), static_cast<std::size_t>(sqlite3_column_bytes(_handle, column)));
}

std::int64_t SQLiteStatement::Integer(int column) const
{
    return static_cast<std::int64_t>(sqlite3_column_int64(_handle, column));
}
