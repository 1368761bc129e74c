#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

#include <spdlog/logger.h>

namespace fs = std::filesystem;

/**
 * @brief What a retention pass did.
 */
struct PruneReport
{
    bool skipped;                 /**< No write permission on the root, nothing was examined */
    std::vector<fs::path> removed; /**< Snapshot directories deleted */
    std::vector<fs::path> failed;  /**< Snapshot directories that could not be deleted */
};

/**
 * @brief Deletes snapshot directories older than a configured age.
 *
 * Retention is best effort: lack of write permission makes it a no-op and a
 * directory that cannot be removed does not stop the others. Verification
 * state is not consulted.
 */
class RetentionManager
{
  public:
    using Clock = std::function<fs::file_time_type()>;
    using WriteAccessCheck = std::function<bool(const fs::path&)>;

    /**
     * @param[in] logger Logger for removals and failures
     * @param[in] clock Current time in the filesystem clock, defaults to file_time_type::clock::now
     * @param[in] writeAccessCheck Permission check, defaults to access(2) with W_OK
     */
    explicit RetentionManager(std::shared_ptr<spdlog::logger> logger, Clock clock = nullptr, WriteAccessCheck writeAccessCheck = nullptr);

    /**
     * @brief Delete timestamp-named subdirectories of root older than maxAgeDays.
     *
     * @param[in] snapshotRootPath Directory holding the snapshots
     * @param[in] maxAgeDays Maximum age in days
     * @param[in] inProgressDirectory Snapshot still being written, never removed whatever its age
     * @return Report of removed and failed directories
     */
    PruneReport Prune(const fs::path& snapshotRootPath, int maxAgeDays, const fs::path& inProgressDirectory = fs::path()) const;

  private:
    void RemoveSnapshot(const fs::path& snapshotDirectory) const;

    std::shared_ptr<spdlog::logger> _logger;
    Clock _clock;
    WriteAccessCheck _writeAccessCheck;
};
