#include "AutoBackup/SnapshotVerifier.hpp"

#include <fstream>
#include <system_error>
#include <utility>

SnapshotVerifier::SnapshotVerifier(std::shared_ptr<spdlog::logger> logger) : _logger(std::move(logger))
{
}

VerificationResult SnapshotVerifier::Verify(SnapshotRun& snapshotRun) const
{
    VerificationResult result{false, {}};

    for (const ArtifactKind artifactKind : snapshotRun.artifacts)
    {
        std::error_code errorCode;
        const bool present = fs::is_regular_file(snapshotRun.ArtifactPath(artifactKind), errorCode);
        if ((0 != errorCode.value()) || (false == present))
        {
            result.missingFiles.emplace_back(ArtifactFileName(artifactKind));
        }
    }

    if (false == result.missingFiles.empty())
    {
        for (const auto& missingFile : result.missingFiles)
        {
            _logger->error("Backup verification failed: {} missing in {}", missingFile, snapshotRun.directory.string());
        }
        return result;
    }

    if (true == snapshotRun.verified)
    {
        result.verified = true;
        return result;
    }

    std::ofstream marker(snapshotRun.MarkerPath(), std::ios::binary | std::ios::trunc);
    if (false == marker.is_open())
    {
        _logger->error("Backup verification failed: cannot write {}", snapshotRun.MarkerPath().string());
        return result;
    }
    marker.close();

    snapshotRun.verified = true;
    result.verified = true;
    _logger->info("Backup verified successfully: {}", snapshotRun.directory.string());
    return result;
}

bool SnapshotVerifier::IsVerified(const fs::path& snapshotDirectory)
{
    std::error_code errorCode;
    return fs::exists(snapshotDirectory / VerificationMarkerFileName, errorCode);
}
