#include "AutoBackup/RetentionManager.hpp"

#include "AutoBackup/BackupErrors.hpp"
#include "TimestampProvider/TimestampProvider.hpp"

#include <system_error>
#include <utility>

#include <unistd.h>

namespace
{
constexpr std::chrono::hours HoursPerDay{24};
}

RetentionManager::RetentionManager(std::shared_ptr<spdlog::logger> logger, Clock clock, WriteAccessCheck writeAccessCheck)
    : _logger(std::move(logger)), _clock(std::move(clock)), _writeAccessCheck(std::move(writeAccessCheck))
{
    if (nullptr == _clock)
    {
        _clock = []() { return fs::file_time_type::clock::now(); };
    }
    if (nullptr == _writeAccessCheck)
    {
        _writeAccessCheck = [](const fs::path& path) { return 0 == access(path.c_str(), W_OK); };
    }
}

PruneReport RetentionManager::Prune(const fs::path& snapshotRootPath, int maxAgeDays, const fs::path& inProgressDirectory) const
{
    PruneReport report{false, {}, {}};

    if (false == _writeAccessCheck(snapshotRootPath))
    {
        _logger->debug("Skipping retention, no write permission on {}", snapshotRootPath.string());
        report.skipped = true;
        return report;
    }

    const fs::file_time_type cutoff = _clock() - (HoursPerDay * maxAgeDays);

    std::vector<fs::path> expired;
    std::error_code errorCode;
    for (const auto& entry : fs::directory_iterator(snapshotRootPath, errorCode))
    {
        std::error_code entryError;
        if ((false == entry.is_directory(entryError)) ||
            (false == TimestampProvider::IsSnapshotName(entry.path().filename().string())))
        {
            continue;
        }
        if ((false == inProgressDirectory.empty()) && (entry.path().filename() == inProgressDirectory.filename()))
        {
            continue;
        }

        const fs::file_time_type modified = entry.last_write_time(entryError);
        if ((0 == entryError.value()) && (modified < cutoff))
        {
            expired.push_back(entry.path());
        }
    }
    if (0 != errorCode.value())
    {
        _logger->warn("Retention could not list {}: {}", snapshotRootPath.string(), errorCode.message());
    }

    for (const auto& snapshotDirectory : expired)
    {
        try
        {
            RemoveSnapshot(snapshotDirectory);
            report.removed.push_back(snapshotDirectory);
            _logger->info("Pruned snapshot {}", snapshotDirectory.filename().string());
        }
        catch (const PruneError& error)
        {
            report.failed.push_back(snapshotDirectory);
            _logger->warn("{}", error.what());
        }
    }

    return report;
}

void RetentionManager::RemoveSnapshot(const fs::path& snapshotDirectory) const
{
    std::error_code errorCode;
    fs::remove_all(snapshotDirectory, errorCode);
    if (0 != errorCode.value())
    {
        throw PruneError("Failed to prune " + snapshotDirectory.string() + ": " + errorCode.message());
    }
}
