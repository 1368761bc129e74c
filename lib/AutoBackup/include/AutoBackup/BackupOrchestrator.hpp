#pragma once

#include "AutoBackup/ArtifactExporter.hpp"
#include "AutoBackup/AutoBackup.hpp"
#include "AutoBackup/PrincipalProvider.hpp"
#include "AutoBackup/RetentionManager.hpp"
#include "AutoBackup/SnapshotVerifier.hpp"
#include "SnapshotDirectoryProvider/SnapshotDirectoryProvider.hpp"

#include <memory>
#include <mutex>

#include <spdlog/logger.h>

/**
 * @brief Produces one verified, timestamped snapshot of the application state.
 *
 * Runs inside the execution environment. Concurrent calls on the same
 * instance are serialized so that at most one snapshot is written at a time.
 */
class BackupOrchestrator
{
  public:
    BackupOrchestrator(const OrchestratorConfig& config, const PrincipalProvider& principalProvider,
                       const SnapshotDirectoryProvider& snapshotDirectoryProvider, ArtifactExporter& artifactExporter,
                       const RetentionManager& retentionManager, const SnapshotVerifier& snapshotVerifier,
                       std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Run one backup.
     *
     * Export failures leave the partial directory on disk without a marker.
     *
     * @return The verified snapshot run
     * @throws PermissionError if not running as the expected user, before touching the filesystem
     * @throws DirectoryCreationError if the snapshot directory cannot be created
     * @throws ExportError if an exporter fails
     * @throws VerificationError if an artifact is missing after export
     */
    SnapshotRun RunBackup();

  private:
    void EnsureExpectedPrincipal() const;
    SnapshotRun CreateSnapshotRun() const;

    OrchestratorConfig _config;
    const PrincipalProvider& _principalProvider;
    const SnapshotDirectoryProvider& _snapshotDirectoryProvider;
    ArtifactExporter& _artifactExporter;
    const RetentionManager& _retentionManager;
    const SnapshotVerifier& _snapshotVerifier;
    std::shared_ptr<spdlog::logger> _logger;
    std::mutex _runMutex;
};
