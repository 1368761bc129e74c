// file SQLiteStatement.hpp:

#pragma once

#include <cstdint>
#include <string>

struct sqlite3_stmt;

/**
 * @brief Owns one prepared statement; it can be rebound and stepped again after Reset().
 */
class SQLiteStatement
{
  public:
    /**
     * @param[in] statement Handle returned by sqlite3_prepare_v2, ownership is taken
     * @throws std::invalid_argument if the handle is null
     */
    explicit SQLiteStatement(sqlite3_stmt* statement);
    ~SQLiteStatement();

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    SQLiteStatement(SQLiteStatement&& other) noexcept;
    SQLiteStatement& operator=(SQLiteStatement&& other) noexcept;

    /**
     * @brief Bind parameters by their 1-based position.
     * @throws SQLiteError on failure
     */
    void Bind(int position, const std::string& value);
    void Bind(int position, std::int64_t value);

    /**
     * @brief Advance to the next result row.
     *
     * @return true while a row is available, false once the statement is done
     * @throws SQLiteError on failure
     */
    bool Step();

    /**
     * @brief Run a statement that produces no rows.
     * @throws SQLiteError on failure or if the statement yields a row
     */
    void Run();

    /**
     * @brief Rewind the statement and clear its bindings so it can run again.
     */
    void Reset() noexcept;

    std::string Text(int column) const;
    std::int64_t Integer(int column) const;

  private:
    sqlite3_stmt* _handle;
};
