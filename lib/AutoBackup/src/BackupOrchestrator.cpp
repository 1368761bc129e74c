#include "AutoBackup/BackupOrchestrator.hpp"

#include "AutoBackup/BackupErrors.hpp"

#include <stdexcept>
#include <utility>

BackupOrchestrator::BackupOrchestrator(const OrchestratorConfig& config, const PrincipalProvider& principalProvider,
                                       const SnapshotDirectoryProvider& snapshotDirectoryProvider, ArtifactExporter& artifactExporter,
                                       const RetentionManager& retentionManager, const SnapshotVerifier& snapshotVerifier,
                                       std::shared_ptr<spdlog::logger> logger)
    : _config(config), _principalProvider(principalProvider), _snapshotDirectoryProvider(snapshotDirectoryProvider),
      _artifactExporter(artifactExporter), _retentionManager(retentionManager), _snapshotVerifier(snapshotVerifier),
      _logger(std::move(logger))
{
}

SnapshotRun BackupOrchestrator::RunBackup()
{
    std::lock_guard<std::mutex> lock(_runMutex);

    EnsureExpectedPrincipal();

    SnapshotRun snapshotRun = CreateSnapshotRun();
    _logger->info("Starting backup {}", snapshotRun.timestamp);

    for (const ArtifactKind artifactKind : snapshotRun.artifacts)
    {
        try
        {
            _artifactExporter.Export(artifactKind, snapshotRun.directory);
        }
        catch (const ExportError& error)
        {
            _logger->error("Backup {} abandoned: {}", snapshotRun.timestamp, error.what());
            throw;
        }
        _logger->debug("Exported {}", ArtifactFileName(artifactKind));
    }

    const PruneReport pruneReport = _retentionManager.Prune(_config.SnapshotRoot(), _config.maxAgeDays, snapshotRun.directory);
    if (false == pruneReport.removed.empty())
    {
        _logger->info("Retention removed {} snapshot(s) older than {} days", pruneReport.removed.size(), _config.maxAgeDays);
    }

    _logger->info("Backup completed at {}", snapshotRun.timestamp);

    const VerificationResult verification = _snapshotVerifier.Verify(snapshotRun);
    if (false == verification.verified)
    {
        std::string missing;
        for (const auto& missingFile : verification.missingFiles)
        {
            missing += (missing.empty() ? "" : ", ") + missingFile;
        }
        throw VerificationError("Backup " + snapshotRun.timestamp + " could not be verified" +
                                (missing.empty() ? std::string() : ", missing: " + missing));
    }

    return snapshotRun;
}

void BackupOrchestrator::EnsureExpectedPrincipal() const
{
    const unsigned int currentUserId = _principalProvider.CurrentUserId();
    if (_config.expectedUserId != currentUserId)
    {
        throw PermissionError("Backup must run as uid " + std::to_string(_config.expectedUserId) + ", current uid is " +
                              std::to_string(currentUserId));
    }
}

SnapshotRun BackupOrchestrator::CreateSnapshotRun() const
{
    SnapshotRun snapshotRun;
    try
    {
        snapshotRun.directory = _snapshotDirectoryProvider.Create(_config.SnapshotRoot());
    }
    catch (const std::runtime_error& error)
    {
        _logger->warn("Cannot create snapshot directory: {}", error.what());
        throw DirectoryCreationError(error.what());
    }
    snapshotRun.timestamp = snapshotRun.directory.filename().string();
    return snapshotRun;
}
