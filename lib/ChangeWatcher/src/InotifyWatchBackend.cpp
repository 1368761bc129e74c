#include "ChangeWatcher/InotifyWatchBackend.hpp"

#include "AutoBackup/BackupErrors.hpp"
#include "AutoBackup/Logging.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <system_error>
#include <utility>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace
{
constexpr std::uint32_t WatchMask = IN_MODIFY | IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF;
constexpr std::size_t EventBufferSize = 64 * 1024;

ChangeEventType ClassifyEvent(std::uint32_t mask)
{
    if (0 != (mask & (IN_CREATE)))
    {
        return ChangeEventType::Created;
    }
    if (0 != (mask & (IN_DELETE | IN_DELETE_SELF)))
    {
        return ChangeEventType::Deleted;
    }
    if (0 != (mask & (IN_MOVED_FROM | IN_MOVED_TO | IN_MOVE_SELF)))
    {
        return ChangeEventType::Moved;
    }
    return ChangeEventType::Modified;
}
}

InotifyWatchBackend::InotifyWatchBackend(std::shared_ptr<spdlog::logger> logger)
    : _inotifyDescriptor(-1), _rootWatch(-1), _rootRemoved(false), _unwatchedDirectories(0), _logger(std::move(logger))
{
    if (nullptr == _logger)
    {
        _logger = CreateNullLogger("inotify-backend");
    }
}

InotifyWatchBackend::~InotifyWatchBackend()
{
    Close();
}

void InotifyWatchBackend::Open(const fs::path& rootPath)
{
    Close();

    std::error_code errorCode;
    if (false == fs::is_directory(rootPath, errorCode))
    {
        throw WatchBackendError("Watch root is not a directory: " + rootPath.string());
    }

    _inotifyDescriptor = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (0 > _inotifyDescriptor)
    {
        throw WatchBackendError(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }

    try
    {
        AddWatchRecursive(rootPath);
    }
    catch (const WatchBackendError&)
    {
        Close();
        throw;
    }
}

WaitStatus InotifyWatchBackend::WaitForChanges(std::chrono::milliseconds timeout, ChangeBatch& batch)
{
    if (0 > _inotifyDescriptor)
    {
        throw WatchBackendError("Watch is not open");
    }
    if (true == _rootRemoved)
    {
        throw WatchBackendError("Watch root was removed or moved");
    }

    pollfd descriptor{_inotifyDescriptor, POLLIN, 0};
    const int ready = poll(&descriptor, 1, static_cast<int>(timeout.count()));
    if (0 == ready)
    {
        return WaitStatus::Timeout;
    }
    if (0 > ready)
    {
        if (EINTR == errno)
        {
            return WaitStatus::Timeout;
        }
        throw WatchBackendError(std::string("poll on inotify failed: ") + std::strerror(errno));
    }

    batch.events.clear();
    DrainEvents(batch);
    return batch.events.empty() ? WaitStatus::Timeout : WaitStatus::Changes;
}

void InotifyWatchBackend::Close() noexcept
{
    if (0 <= _inotifyDescriptor)
    {
        close(_inotifyDescriptor);
        _inotifyDescriptor = -1;
    }
    _watchedDirectories.clear();
    _rootWatch = -1;
    _rootRemoved = false;
    _unwatchedDirectories = 0;
}

std::size_t InotifyWatchBackend::UnwatchedDirectoryCount() const
{
    return _unwatchedDirectories;
}

void InotifyWatchBackend::AddWatchRecursive(const fs::path& directory)
{
    AddWatch(directory);

    std::error_code errorCode;
    for (fs::recursive_directory_iterator iterator(directory, fs::directory_options::skip_permission_denied, errorCode), end;
         (0 == errorCode.value()) && (iterator != end); iterator.increment(errorCode))
    {
        std::error_code entryError;
        if ((true == iterator->is_directory(entryError)) && (false == iterator->is_symlink(entryError)))
        {
            AddWatch(iterator->path());
        }
    }
}

void InotifyWatchBackend::AddWatch(const fs::path& directory)
{
    const int watch = inotify_add_watch(_inotifyDescriptor, directory.c_str(), WatchMask);
    if (0 > watch)
    {
        if (-1 == _rootWatch)
        {
            throw WatchBackendError("Cannot watch " + directory.string() + ": " + std::strerror(errno));
        }
        const int watchError = errno;
        // Subdirectories can vanish between listing and watching.
        if (ENOENT == watchError)
        {
            _logger->debug("{} disappeared before it could be watched", directory.string());
            return;
        }
        ++_unwatchedDirectories;
        _logger->warn("Changes under {} will go unnoticed, inotify_add_watch failed: {}{}", directory.string(), std::strerror(watchError),
                      (ENOSPC == watchError) ? " (raise fs.inotify.max_user_watches)" : "");
        return;
    }
    if (-1 == _rootWatch)
    {
        _rootWatch = watch;
    }
    _watchedDirectories[watch] = directory;
}

void InotifyWatchBackend::DrainEvents(ChangeBatch& batch)
{
    alignas(inotify_event) char buffer[EventBufferSize];

    while (true)
    {
        const ssize_t bytesRead = read(_inotifyDescriptor, buffer, sizeof(buffer));
        if (0 > bytesRead)
        {
            if ((EAGAIN == errno) || (EWOULDBLOCK == errno) || (EINTR == errno))
            {
                return;
            }
            throw WatchBackendError(std::string("read on inotify failed: ") + std::strerror(errno));
        }
        if (0 == bytesRead)
        {
            return;
        }

        for (ssize_t offset = 0; offset < bytesRead;)
        {
            const auto* event = reinterpret_cast<const inotify_event*>(buffer + offset);
            offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

            if (0 != (event->mask & IN_Q_OVERFLOW))
            {
                batch.events.push_back({ChangeEventType::Modified, {}});
                continue;
            }

            const auto watched = _watchedDirectories.find(event->wd);
            if (_watchedDirectories.end() == watched)
            {
                continue;
            }

            if (0 != (event->mask & IN_IGNORED))
            {
                _rootRemoved = _rootRemoved || (event->wd == _rootWatch);
                _watchedDirectories.erase(watched);
                continue;
            }

            const fs::path affected = (0 < event->len) ? watched->second / event->name : watched->second;
            batch.events.push_back({ClassifyEvent(event->mask), affected});

            if ((event->wd == _rootWatch) && (0 != (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF))))
            {
                _rootRemoved = true;
            }
            if ((0 != (event->mask & IN_ISDIR)) && (0 != (event->mask & (IN_CREATE | IN_MOVED_TO))))
            {
                AddWatchRecursive(affected);
            }
        }
    }
}
