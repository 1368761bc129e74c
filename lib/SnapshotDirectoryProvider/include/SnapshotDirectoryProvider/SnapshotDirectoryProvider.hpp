#pragma once

#include "TimestampProvider/TimestampProvider.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Infrastructure component that creates fresh, timestamp-named snapshot directories.
 *
 * Names are strictly increasing: when the clock has not moved past the newest
 * existing snapshot name, creation waits for the next second before giving up.
 * A future-dated snapshot (clock set back, DST fall-back) therefore blocks
 * creation until local time passes its name.
 */
class SnapshotDirectoryProvider
{
  public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr std::chrono::milliseconds PollInterval{100};
    static constexpr int MaxPollAttempts = 25;

    /**
     * @brief Construct a snapshot directory provider.
     *
     * @param[in] timestampProvider Timestamp provider used to name directories
     * @param[in] sleeper Wait function used while the clock catches up
     */
    explicit SnapshotDirectoryProvider(const TimestampProvider& timestampProvider, Sleeper sleeper = nullptr);

    /**
     * @brief Create a new snapshot directory under the snapshot root.
     *
     * The snapshot root is created when missing. The snapshot directory itself
     * must not exist beforehand.
     *
     * @param[in] snapshotRootPath Directory holding all snapshots
     * @return Path of the newly created snapshot directory
     * @throws std::runtime_error if no fresh directory could be created
     */
    fs::path Create(const fs::path& snapshotRootPath) const;

    /**
     * @brief Find the greatest snapshot name below the snapshot root.
     *
     * @param[in] snapshotRootPath Directory holding all snapshots
     * @return Newest snapshot name, empty if there is none
     */
    static std::string LatestSnapshotName(const fs::path& snapshotRootPath);

  private:
    const TimestampProvider& _timestampProvider;
    Sleeper _sleeper;
};
