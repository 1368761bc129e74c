#pragma once

#include "AutoBackup/AutoBackup.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

/**
 * @brief Result of checking a snapshot directory for its required artifacts.
 */
struct VerificationResult
{
    bool verified;                          /**< Marker written, every artifact present */
    std::vector<std::string> missingFiles;  /**< Artifact files that were not found */
};

/**
 * @brief Confirms that all artifacts of a run exist and writes the verification marker.
 *
 * Only existence is checked. The marker is written strictly after every
 * artifact has been confirmed, and never when one is missing.
 */
class SnapshotVerifier
{
  public:
    explicit SnapshotVerifier(std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Verify a run and mark it on success.
     *
     * @param[in,out] snapshotRun Run to verify, its verified flag is set on success
     * @return Verification outcome
     */
    VerificationResult Verify(SnapshotRun& snapshotRun) const;

    /**
     * @brief Check whether a snapshot directory carries the verification marker.
     *
     * @param[in] snapshotDirectory Directory to inspect
     * @return true if the marker file exists
     */
    static bool IsVerified(const fs::path& snapshotDirectory);

  private:
    std::shared_ptr<spdlog::logger> _logger;
};
