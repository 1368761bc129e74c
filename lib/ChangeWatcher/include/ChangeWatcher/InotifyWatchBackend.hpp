#pragma once

#include "ChangeWatcher/WatchBackend.hpp"

#include <cstddef>
#include <memory>
#include <unordered_map>

#include <spdlog/logger.h>

/**
 * @brief Native Linux inotify backend watching every directory of a tree.
 *
 * Directories created or moved into the tree are watched as they appear.
 * Removing or moving the root ends the session: the batch reporting it is
 * still delivered, the next wait fails. A subdirectory that cannot be watched
 * (watch limit reached, no read permission) is logged and left unwatched.
 */
class InotifyWatchBackend : public WatchBackend
{
  public:
    explicit InotifyWatchBackend(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~InotifyWatchBackend() override;

    InotifyWatchBackend(const InotifyWatchBackend&) = delete;
    InotifyWatchBackend& operator=(const InotifyWatchBackend&) = delete;

    void Open(const fs::path& rootPath) override;
    WaitStatus WaitForChanges(std::chrono::milliseconds timeout, ChangeBatch& batch) override;
    void Close() noexcept override;

    /**
     * @brief Subdirectories of the current session that could not be watched.
     */
    std::size_t UnwatchedDirectoryCount() const;

  private:
    void AddWatchRecursive(const fs::path& directory);
    void AddWatch(const fs::path& directory);
    void DrainEvents(ChangeBatch& batch);

    int _inotifyDescriptor;
    int _rootWatch;
    bool _rootRemoved;
    std::size_t _unwatchedDirectories;
    std::unordered_map<int, fs::path> _watchedDirectories;
    std::shared_ptr<spdlog::logger> _logger;
};
