// file SQLiteSession.hpp:

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

class SQLiteConnection;

/**
 * @brief Hands each calling thread its own connection to one database file.
 *
 * Connections are opened lazily and live until the session is destroyed.
 */
class SQLiteSession
{
  public:
    explicit SQLiteSession(std::filesystem::path databasePath,
                           std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));
    ~SQLiteSession();

    SQLiteSession(const SQLiteSession&) = delete;
    SQLiteSession& operator=(const SQLiteSession&) = delete;

    /**
     * @brief Connection owned by the calling thread, opened on first use.
     * @throws SQLiteError if the database cannot be opened
     */
    SQLiteConnection& Acquire();

  private:
    const std::filesystem::path _databasePath;
    const std::chrono::milliseconds _busyTimeout;
    std::mutex _connectionsMutex;
    std::unordered_map<std::thread::id, std::unique_ptr<SQLiteConnection>> _connections;
};
