#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Enumeration of the filesystem changes that trigger a backup.
 */
enum class ChangeEventType
{
    Modified, /**< File content changed */
    Created,  /**< File or directory created */
    Deleted,  /**< File or directory deleted */
    Moved     /**< File or directory renamed or moved in or out */
};

/**
 * @brief Convert a ChangeEventType enumeration value to its string representation.
 *
 * @param[in] changeEventType The change type to convert
 * @return String representation of the change type
 */
inline const char* ChangeEventTypeToString(ChangeEventType changeEventType)
{
    switch (changeEventType)
    {
    case ChangeEventType::Modified:
        return "Modified";
    case ChangeEventType::Created:
        return "Created";
    case ChangeEventType::Deleted:
        return "Deleted";
    case ChangeEventType::Moved:
        return "Moved";
    }
    return "Unknown";
}

/**
 * @brief Convert a string to its corresponding ChangeEventType value.
 *
 * Accepts the names produced by ChangeEventTypeToString and the upper-case
 * event names printed by inotifywait (MODIFY, CREATE, DELETE, MOVED_FROM, ...).
 *
 * @param[in] stringValue The string to convert
 * @return Corresponding ChangeEventType, defaults to Modified if the string is not recognized
 */
inline ChangeEventType StringToChangeEventType(const std::string& stringValue)
{
    if (("Created" == stringValue) || ("CREATE" == stringValue))
    {
        return ChangeEventType::Created;
    }
    if (("Deleted" == stringValue) || ("DELETE" == stringValue) || ("DELETE_SELF" == stringValue))
    {
        return ChangeEventType::Deleted;
    }
    if (("Moved" == stringValue) || ("MOVED_FROM" == stringValue) || ("MOVED_TO" == stringValue) || ("MOVE_SELF" == stringValue))
    {
        return ChangeEventType::Moved;
    }
    return ChangeEventType::Modified;
}

/**
 * @brief One observed filesystem change.
 */
struct ChangeEvent
{
    ChangeEventType type; /**< Kind of change */
    fs::path path;        /**< Affected path, may be empty when the backend does not report it */
};

/**
 * @brief All changes read from the notification primitive in one go.
 */
struct ChangeBatch
{
    std::vector<ChangeEvent> events;
};

/**
 * @brief Result of waiting for changes.
 */
enum class WaitStatus
{
    Changes, /**< A batch of changes was observed */
    Timeout  /**< Nothing happened before the timeout */
};

/**
 * @brief One watch session on a directory tree.
 *
 * Implementations throw WatchBackendError when the watch cannot be set up,
 * fails, or terminates. The watcher closes and reopens the backend to restart.
 */
class WatchBackend
{
  public:
    virtual ~WatchBackend() = default;

    /**
     * @brief Establish the watch.
     *
     * @param[in] rootPath Directory tree to watch recursively
     */
    virtual void Open(const fs::path& rootPath) = 0;

    /**
     * @brief Wait up to timeout for the next batch of changes.
     *
     * @param[in] timeout Maximum time to wait
     * @param[out] batch Changes observed, filled when Changes is returned
     */
    virtual WaitStatus WaitForChanges(std::chrono::milliseconds timeout, ChangeBatch& batch) = 0;

    /**
     * @brief Release everything Open acquired. Safe to call repeatedly.
     */
    virtual void Close() noexcept = 0;
};
