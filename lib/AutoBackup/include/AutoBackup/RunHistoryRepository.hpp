// file RunHistoryRepository.hpp:

#pragma once

#include "AutoBackup/AutoBackup.hpp"
#include "SQLiteSession/SQLiteSession.hpp"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Size and fingerprint of one file inside a recorded snapshot.
 */
struct ArtifactRecord
{
    std::string name;     /**< File name inside the snapshot directory */
    std::uintmax_t size;  /**< Size in bytes */
    std::string hash;     /**< Hex-encoded XXH64 digest, empty if the file could not be read */
};

/**
 * @brief One Outer Invoker run as stored in the history database.
 */
struct RunRecord
{
    std::int64_t id;                      /**< Row id, assigned on insert */
    TriggerSource trigger;                /**< What requested the run */
    std::string startedAt;                /**< Human-readable local start time */
    std::int64_t durationMs;              /**< Wall-clock duration */
    bool succeeded;                       /**< Marker found after the run */
    std::string reason;                   /**< Failure reason, empty on success */
    std::string snapshotDirectory;        /**< Newest snapshot directory inspected */
    std::vector<ArtifactRecord> artifacts; /**< Contents of the snapshot directory on success */
};

/**
 * @brief Adapter for persisting backup run history using SQLite.
 */
class RunHistoryRepository
{
  public:
    /**
     * @brief Create a repository bound to a SQLite session.
     *
     * @param[in] databaseSession Active SQLite session for persistence
     */
    explicit RunHistoryRepository(SQLiteSession& databaseSession);

    /**
     * @brief Create required database schema if it does not exist.
     *
     * @return true on success, false on error
     */
    bool InitializeSchema();

    /**
     * @brief Store a run and its artifacts.
     *
     * @param[in] runRecord Run to store, its id is ignored
     * @return true on success, false on error
     */
    bool RecordRun(const RunRecord& runRecord);

    /**
     * @brief Retrieve the newest runs, newest first.
     *
     * @param[in] limit Maximum number of runs
     * @return Stored runs including their artifacts
     * @throws SQLiteError on SQLite failure
     */
    std::vector<RunRecord> GetRecentRuns(std::size_t limit);

  private:
    SQLiteSession& _databaseSession;
};
