#pragma once

#include "AutoBackup/AutoBackup.hpp"
#include "CommandRunner/CommandRunner.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace fs = std::filesystem;

/**
 * @brief Capability that writes one snapshot artifact into a snapshot directory.
 */
class ArtifactExporter
{
  public:
    virtual ~ArtifactExporter() = default;

    /**
     * @brief Produce one artifact.
     *
     * @param[in] artifactKind Artifact to produce
     * @param[in] snapshotDirectory Directory of the current snapshot run
     * @return Path of the written artifact
     * @throws ExportError if the artifact could not be produced
     */
    virtual fs::path Export(ArtifactKind artifactKind, const fs::path& snapshotDirectory) = 0;
};

/**
 * @brief Exports artifacts through the application's command-line tooling and tar.
 */
class CommandArtifactExporter : public ArtifactExporter
{
  public:
    /**
     * @param[in] commandRunner Runner for the export commands
     * @param[in] appCli Application export tool
     * @param[in] stateDir Application state directory archived for FullArchive
     * @param[in] logger Logger for command output
     */
    CommandArtifactExporter(CommandRunner& commandRunner, std::string appCli, fs::path stateDir,
                            std::shared_ptr<spdlog::logger> logger);

    fs::path Export(ArtifactKind artifactKind, const fs::path& snapshotDirectory) override;

    /**
     * @brief Command line that produces the artifact at outputPath.
     */
    std::vector<std::string> BuildCommand(ArtifactKind artifactKind, const fs::path& outputPath) const;

  private:
    CommandRunner& _commandRunner;
    std::string _appCli;
    fs::path _stateDir;
    std::shared_ptr<spdlog::logger> _logger;
};
