// file SQLiteSession.cpp

#include "SQLiteSession/SQLiteSession.hpp"

#include "SQLiteSession/SQLiteConnection.hpp"

#include <utility>

SQLiteSession::SQLiteSession(std::filesystem::path databasePath, std::chrono::milliseconds busyTimeout)
    : _databasePath(std::move(databasePath)), _busyTimeout(busyTimeout)
{
}

SQLiteSession::~SQLiteSession() = default;

SQLiteConnection& SQLiteSession::Acquire()
{
    std::lock_guard<std::mutex> lock(_connectionsMutex);

    std::unique_ptr<SQLiteConnection>& connection = _connections[std::this_thread::get_id()];
    if (nullptr == connection)
    {
        connection = std::make_unique<SQLiteConnection>(_databasePath, _busyTimeout);
    }
    return *connection;
}
