// file AutoBackup.hpp:

#pragma once

#include <array>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Directory below the backup root that holds all snapshot directories.
 */
constexpr const char* SnapshotRootDirectoryName = "auto-backups";

/**
 * @brief Zero-byte sentinel proving that every artifact was present when checked.
 */
constexpr const char* VerificationMarkerFileName = ".backup_verified";

/**
 * @brief Enumeration of the artifacts every snapshot run produces.
 */
enum class ArtifactKind
{
    Workflows,   /**< Workflow export */
    Credentials, /**< Credential export */
    FullArchive  /**< Compressed archive of the full application state directory */
};

/**
 * @brief Required artifacts in the order they are exported.
 */
constexpr std::array<ArtifactKind, 3> RequiredArtifacts = {ArtifactKind::Workflows, ArtifactKind::Credentials,
                                                           ArtifactKind::FullArchive};

/**
 * @brief Convert an ArtifactKind enumeration value to its string representation.
 *
 * @param[in] artifactKind The artifact kind to convert
 * @return String representation of the artifact kind
 */
inline const char* ArtifactKindToString(ArtifactKind artifactKind)
{
    switch (artifactKind)
    {
    case ArtifactKind::Workflows:
        return "Workflows";
    case ArtifactKind::Credentials:
        return "Credentials";
    case ArtifactKind::FullArchive:
        return "FullArchive";
    }
    return "Unknown";
}

/**
 * @brief File name an artifact is written to inside its snapshot directory.
 *
 * @param[in] artifactKind The artifact kind
 * @return File name relative to the snapshot directory
 */
inline const char* ArtifactFileName(ArtifactKind artifactKind)
{
    switch (artifactKind)
    {
    case ArtifactKind::Workflows:
        return "workflows.json";
    case ArtifactKind::Credentials:
        return "credentials.json";
    case ArtifactKind::FullArchive:
        return "full_backup.tar.gz";
    }
    return "unknown";
}

/**
 * @brief What caused a backup to be requested.
 */
enum class TriggerSource
{
    Manual, /**< One-shot run from the command line */
    Change, /**< Filesystem change passed the debounce window */
    Timer   /**< Scheduled run */
};

inline const char* TriggerSourceToString(TriggerSource triggerSource)
{
    switch (triggerSource)
    {
    case TriggerSource::Manual:
        return "manual";
    case TriggerSource::Change:
        return "change";
    case TriggerSource::Timer:
        return "timer";
    }
    return "unknown";
}

/**
 * @brief Convert a string to its corresponding TriggerSource value.
 *
 * @param[in] stringValue The string to convert
 * @return Corresponding TriggerSource, defaults to Manual if the string is not recognized
 */
inline TriggerSource StringToTriggerSource(const std::string& stringValue)
{
    if ("change" == stringValue)
    {
        return TriggerSource::Change;
    }
    if ("timer" == stringValue)
    {
        return TriggerSource::Timer;
    }
    return TriggerSource::Manual;
}

/**
 * @brief One backup attempt and the directory it exclusively owns.
 */
struct SnapshotRun
{
    std::string timestamp;               /**< YYYYMMDD_HHMMSS, also the directory name */
    fs::path directory;                  /**< Snapshot directory created for this run */
    std::vector<ArtifactKind> artifacts; /**< Required artifacts in export order */
    bool verified;                       /**< Set once every artifact was confirmed present */

    SnapshotRun()
        : artifacts(RequiredArtifacts.begin(), RequiredArtifacts.end())
        , verified(false)
    {
    }

    fs::path ArtifactPath(ArtifactKind artifactKind) const
    {
        return directory / ArtifactFileName(artifactKind);
    }

    fs::path MarkerPath() const
    {
        return directory / VerificationMarkerFileName;
    }
};

/**
 * @brief Configuration of the in-environment Backup Orchestrator.
 */
struct OrchestratorConfig
{
    fs::path backupRoot;  /**< Backup root inside the execution environment */
    unsigned int expectedUserId; /**< Effective uid the orchestrator must run as */
    int maxAgeDays;       /**< Snapshots older than this are pruned */
    std::string appCli;   /**< Application export tool */
    fs::path stateDir;    /**< Application state directory archived in full */

    OrchestratorConfig()
        : backupRoot("/backup")
        , expectedUserId(1000)
        , maxAgeDays(7)
        , appCli("n8n")
        , stateDir("/home/node/.n8n")
    {
    }

    fs::path SnapshotRoot() const
    {
        return backupRoot / SnapshotRootDirectoryName;
    }
};

/**
 * @brief Configuration of the host-side Outer Invoker.
 */
struct InvokerConfig
{
    fs::path hostBackupRoot;                    /**< Backup root as seen from the host */
    fs::path environmentBackupRoot;             /**< Same directory as seen from inside the environment */
    std::string principal;                      /**< User the orchestrator is run as */
    std::vector<std::string> orchestratorCommand; /**< Command line of the orchestrator inside the environment */
    fs::path stageSource;                       /**< Optional host binary copied into the environment before each run */
    fs::path stageTarget;                       /**< Destination of the staged binary */
    fs::path historyDatabase;                   /**< Run history database, empty disables history */

    InvokerConfig()
        : environmentBackupRoot("/backup")
        , principal("node")
    {
    }

    fs::path HostSnapshotRoot() const
    {
        return hostBackupRoot / SnapshotRootDirectoryName;
    }

    fs::path EnvironmentSnapshotRoot() const
    {
        return environmentBackupRoot / SnapshotRootDirectoryName;
    }
};

/**
 * @brief Configuration of the change-triggered watch loop.
 */
struct WatchConfig
{
    fs::path watchRoot;                      /**< Directory tree observed for changes */
    std::chrono::seconds minInterval;        /**< Minimum spacing between triggered backups */
    std::chrono::seconds restartDelay;       /**< Wait before re-establishing a failed watch */
    std::vector<std::string> helperCommand;  /**< External watcher helper, empty selects native inotify */
    std::vector<std::string> helperTeardown; /**< Command removing the helper's resources */

    WatchConfig()
        : watchRoot("/home/node/.n8n")
        , minInterval(150)
        , restartDelay(5)
    {
    }
};

/**
 * @brief Configuration of the timer-only mode.
 */
struct ScheduleConfig
{
    std::chrono::seconds interval; /**< Time between scheduled backups */
    bool runOnStart;               /**< Run one backup immediately when the schedule starts */

    ScheduleConfig()
        : interval(3600)
        , runOnStart(true)
    {
    }
};
