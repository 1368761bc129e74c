#pragma once

#include "AutoBackup/AutoBackup.hpp"
#include "AutoBackup/ExecutionEnvironment.hpp"
#include "AutoBackup/RunHistoryRepository.hpp"
#include "FileHasher/FileHasher.hpp"
#include "TimestampProvider/TimestampProvider.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

/**
 * @brief Reason reported whenever the newest snapshot carries no verification marker.
 */
constexpr const char* UnverifiedBackupReason = "backup failed or could not be verified";

/**
 * @brief Host-side outcome of one triggered backup.
 */
struct InvocationResult
{
    bool succeeded;                       /**< Newest snapshot is new and carries the marker */
    fs::path directory;                   /**< Newest snapshot directory, empty if none was found */
    std::string reason;                   /**< Failure reason, empty on success */
    std::vector<ArtifactRecord> contents; /**< Files in the snapshot directory on success */
};

/**
 * @brief Runs the Backup Orchestrator inside the execution environment and
 * judges the result from the host side by the verification marker alone.
 */
class OuterInvoker
{
  public:
    /**
     * @param[in] config Host and environment paths, principal and orchestrator command
     * @param[in] environment Environment the orchestrator runs in
     * @param[in] fileHasher Fingerprints snapshot contents for reporting
     * @param[in] timestampProvider Source of run start times
     * @param[in] logger Logger for progress and orchestrator output
     * @param[in] runHistory Optional history store, nullptr disables recording
     */
    OuterInvoker(const InvokerConfig& config, ExecutionEnvironment& environment, const FileHasher& fileHasher,
                 const TimestampProvider& timestampProvider, std::shared_ptr<spdlog::logger> logger,
                 RunHistoryRepository* runHistory = nullptr);

    /**
     * @brief Run one backup and report whether it was verified.
     *
     * @param[in] triggerSource What requested the backup, recorded in the history
     * @return Success with the snapshot directory, or a failure reason
     */
    InvocationResult TriggerBackup(TriggerSource triggerSource);

    /**
     * @brief Newest snapshot directory by modification time, name breaking ties.
     *
     * @param[in] snapshotRootPath Directory holding the snapshots
     * @return Newest snapshot directory, std::nullopt if there is none
     */
    static std::optional<fs::path> FindLatestSnapshot(const fs::path& snapshotRootPath);

  private:
    InvocationResult Invoke();
    bool PrepareHostDirectory(InvocationResult& result) const;
    bool PrepareEnvironment(InvocationResult& result);
    bool RunOrchestrator(InvocationResult& result);
    void InspectResult(const std::optional<fs::path>& previousSnapshot, InvocationResult& result) const;
    std::vector<ArtifactRecord> ListContents(const fs::path& snapshotDirectory) const;
    void Record(TriggerSource triggerSource, const std::string& startedAt, std::int64_t durationMs, const InvocationResult& result);

    InvokerConfig _config;
    ExecutionEnvironment& _environment;
    const FileHasher& _fileHasher;
    const TimestampProvider& _timestampProvider;
    std::shared_ptr<spdlog::logger> _logger;
    RunHistoryRepository* _runHistory;
};
