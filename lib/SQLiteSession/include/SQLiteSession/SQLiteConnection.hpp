// file SQLiteConnection.hpp:

#pragma once

#include "SQLiteSession/SQLiteStatement.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

struct sqlite3;

/**
 * @brief One open database handle in WAL mode with foreign keys enforced.
 */
class SQLiteConnection
{
  public:
    /**
     * @brief Open (creating if needed) the database file.
     *
     * @param[in] databasePath Database file, its parent directory must exist
     * @param[in] busyTimeout How long a locked database is retried before failing
     * @throws SQLiteError if the file cannot be opened or configured
     */
    SQLiteConnection(const std::filesystem::path& databasePath, std::chrono::milliseconds busyTimeout);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    /**
     * @brief Run one or more statements that produce no rows.
     * @throws SQLiteError on failure
     */
    void Execute(const std::string& sql);

    /**
     * @throws SQLiteError if the statement does not compile
     */
    SQLiteStatement Prepare(const std::string& sql);

    std::int64_t LastInsertRowId() const;

    /**
     * @brief Schema version stored in the database header (PRAGMA user_version).
     */
    int UserVersion();
    void SetUserVersion(int version);

  private:
    sqlite3* _database;
};

/**
 * @brief Scoped write transaction, rolled back unless Commit() is reached.
 */
class SQLiteTransaction
{
  public:
    /**
     * @brief Begin an IMMEDIATE transaction so the write lock is taken up front.
     * @throws SQLiteError if the transaction cannot begin
     */
    explicit SQLiteTransaction(SQLiteConnection& connection);
    ~SQLiteTransaction();

    SQLiteTransaction(const SQLiteTransaction&) = delete;
    SQLiteTransaction& operator=(const SQLiteTransaction&) = delete;

    void Commit();

  private:
    SQLiteConnection& _connection;
    bool _open;
};
