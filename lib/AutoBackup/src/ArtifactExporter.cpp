#include "AutoBackup/ArtifactExporter.hpp"

#include "AutoBackup/BackupErrors.hpp"

#include <system_error>
#include <utility>

CommandArtifactExporter::CommandArtifactExporter(CommandRunner& commandRunner, std::string appCli, fs::path stateDir,
                                                 std::shared_ptr<spdlog::logger> logger)
    : _commandRunner(commandRunner), _appCli(std::move(appCli)), _stateDir(std::move(stateDir)), _logger(std::move(logger))
{
}

fs::path CommandArtifactExporter::Export(ArtifactKind artifactKind, const fs::path& snapshotDirectory)
{
    const fs::path outputPath = snapshotDirectory / ArtifactFileName(artifactKind);
    const std::vector<std::string> command = BuildCommand(artifactKind, outputPath);

    _logger->debug("Exporting {}: {}", ArtifactKindToString(artifactKind), FormatCommandLine(command));

    CommandResult result;
    try
    {
        result = _commandRunner.Run(command);
    }
    catch (const std::runtime_error& error)
    {
        throw ExportError(std::string("Export of ") + ArtifactFileName(artifactKind) + " could not start: " + error.what());
    }

    if (false == result.output.empty())
    {
        _logger->debug("{}", result.output);
    }

    if (false == result.Succeeded())
    {
        throw ExportError(std::string("Export of ") + ArtifactFileName(artifactKind) + " exited with status " +
                          std::to_string(result.exitCode) + ": " + result.output);
    }

    std::error_code errorCode;
    if (false == fs::exists(outputPath, errorCode))
    {
        throw ExportError(std::string("Export of ") + ArtifactFileName(artifactKind) + " produced no file at " + outputPath.string());
    }
    return outputPath;
}

std::vector<std::string> CommandArtifactExporter::BuildCommand(ArtifactKind artifactKind, const fs::path& outputPath) const
{
    switch (artifactKind)
    {
    case ArtifactKind::Workflows:
        return {_appCli, "export:workflow", "--all", "--output=" + outputPath.string()};
    case ArtifactKind::Credentials:
        return {_appCli, "export:credentials", "--all", "--output=" + outputPath.string()};
    case ArtifactKind::FullArchive:
    {
        const fs::path stateParent = _stateDir.has_parent_path() ? _stateDir.parent_path() : fs::path(".");
        return {"tar", "czf", outputPath.string(), "-C", stateParent.string(), _stateDir.filename().string()};
    }
    }
    throw ExportError("Unknown artifact kind");
}
