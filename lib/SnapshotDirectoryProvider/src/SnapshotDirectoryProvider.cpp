#include "SnapshotDirectoryProvider/SnapshotDirectoryProvider.hpp"

#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

SnapshotDirectoryProvider::SnapshotDirectoryProvider(const TimestampProvider& timestampProvider, Sleeper sleeper)
    : _timestampProvider(timestampProvider), _sleeper(std::move(sleeper))
{
    if (nullptr == _sleeper)
    {
        _sleeper = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

fs::path SnapshotDirectoryProvider::Create(const fs::path& snapshotRootPath) const
{
    std::error_code errorCode;
    fs::create_directories(snapshotRootPath, errorCode);
    if (0 != errorCode.value())
    {
        throw std::runtime_error("Failed to create snapshot root " + snapshotRootPath.string() + ": " + errorCode.message());
    }

    const std::string latestName = LatestSnapshotName(snapshotRootPath);
    std::string snapshotName = _timestampProvider.NowSnapshotName();
    for (int attempt = 0; (false == latestName.empty()) && (snapshotName <= latestName); ++attempt)
    {
        if (MaxPollAttempts <= attempt)
        {
            throw std::runtime_error("Newest snapshot " + latestName + " is ahead of the clock (now " + snapshotName +
                                     "), no snapshot can be created until the clock passes it");
        }
        _sleeper(PollInterval);
        snapshotName = _timestampProvider.NowSnapshotName();
    }

    fs::path snapshotDirectory = snapshotRootPath / snapshotName;
    const bool created = fs::create_directory(snapshotDirectory, errorCode);
    if (0 != errorCode.value())
    {
        throw std::runtime_error("Failed to create snapshot directory " + snapshotDirectory.string() + ": " + errorCode.message());
    }
    if (false == created)
    {
        throw std::runtime_error("Snapshot directory already exists: " + snapshotDirectory.string());
    }
    return snapshotDirectory;
}

std::string SnapshotDirectoryProvider::LatestSnapshotName(const fs::path& snapshotRootPath)
{
    std::string latestName;
    std::error_code errorCode;
    for (const auto& entry : fs::directory_iterator(snapshotRootPath, errorCode))
    {
        std::error_code entryError;
        if (false == entry.is_directory(entryError))
        {
            continue;
        }

        const std::string name = entry.path().filename().string();
        if ((true == TimestampProvider::IsSnapshotName(name)) && (name > latestName))
        {
            latestName = name;
        }
    }
    return latestName;
}
