#include "AutoBackup/OuterInvoker.hpp"

#include "AutoBackup/SnapshotVerifier.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace
{
constexpr const char* EnvironmentDirectoryMode = "777";
constexpr fs::perms HostDirectoryPermissions = fs::perms::all;

void LogCommandOutput(const std::shared_ptr<spdlog::logger>& logger, const std::string& output)
{
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line))
    {
        if (false == line.empty())
        {
            logger->info("  | {}", line);
        }
    }
}
}

OuterInvoker::OuterInvoker(const InvokerConfig& config, ExecutionEnvironment& environment, const FileHasher& fileHasher,
                           const TimestampProvider& timestampProvider, std::shared_ptr<spdlog::logger> logger,
                           RunHistoryRepository* runHistory)
    : _config(config), _environment(environment), _fileHasher(fileHasher), _timestampProvider(timestampProvider),
      _logger(std::move(logger)), _runHistory(runHistory)
{
}

InvocationResult OuterInvoker::TriggerBackup(TriggerSource triggerSource)
{
    const std::string startedAt = _timestampProvider.NowReadable();
    const auto started = std::chrono::steady_clock::now();

    _logger->info("Running {} backup in {}", TriggerSourceToString(triggerSource), _environment.Describe());
    InvocationResult result = Invoke();

    const auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    if (true == result.succeeded)
    {
        _logger->info("Backup completed and verified successfully: {}", result.directory.string());
    }
    else
    {
        _logger->error("Backup failed: {}", result.reason);
    }

    Record(triggerSource, startedAt, static_cast<std::int64_t>(durationMs), result);
    return result;
}

std::optional<fs::path> OuterInvoker::FindLatestSnapshot(const fs::path& snapshotRootPath)
{
    std::optional<fs::path> latest;
    fs::file_time_type latestTime{};

    std::error_code errorCode;
    for (const auto& entry : fs::directory_iterator(snapshotRootPath, errorCode))
    {
        std::error_code entryError;
        if ((false == entry.is_directory(entryError)) ||
            (false == TimestampProvider::IsSnapshotName(entry.path().filename().string())))
        {
            continue;
        }

        const fs::file_time_type modified = entry.last_write_time(entryError);
        if (0 != entryError.value())
        {
            continue;
        }

        if ((false == latest.has_value()) || (modified > latestTime) ||
            ((modified == latestTime) && (entry.path().filename() > latest->filename())))
        {
            latest = entry.path();
            latestTime = modified;
        }
    }
    return latest;
}

InvocationResult OuterInvoker::Invoke()
{
    InvocationResult result{false, {}, {}, {}};

    if (false == PrepareHostDirectory(result))
    {
        return result;
    }

    const std::optional<fs::path> previousSnapshot = FindLatestSnapshot(_config.HostSnapshotRoot());

    if (false == PrepareEnvironment(result))
    {
        return result;
    }

    if (false == RunOrchestrator(result))
    {
        return result;
    }

    InspectResult(previousSnapshot, result);
    return result;
}

bool OuterInvoker::PrepareHostDirectory(InvocationResult& result) const
{
    const fs::path hostSnapshotRoot = _config.HostSnapshotRoot();

    std::error_code errorCode;
    fs::create_directories(hostSnapshotRoot, errorCode);
    if (0 == errorCode.value())
    {
        fs::permissions(hostSnapshotRoot, HostDirectoryPermissions, fs::perm_options::replace, errorCode);
    }
    if (0 != errorCode.value())
    {
        result.reason = "cannot prepare " + hostSnapshotRoot.string() + ": " + errorCode.message();
        return false;
    }
    return true;
}

bool OuterInvoker::PrepareEnvironment(InvocationResult& result)
{
    try
    {
        if ((false == _config.stageSource.empty()) && (false == _config.stageTarget.empty()))
        {
            const CommandResult copied = _environment.CopyInto(_config.stageSource, _config.stageTarget);
            if (false == copied.Succeeded())
            {
                LogCommandOutput(_logger, copied.output);
                result.reason = "cannot copy " + _config.stageSource.string() + " into the environment";
                return false;
            }
        }

        const CommandResult created = _environment.CreateDirectory(_config.EnvironmentSnapshotRoot(), EnvironmentDirectoryMode);
        if (false == created.Succeeded())
        {
            LogCommandOutput(_logger, created.output);
            result.reason = "cannot create " + _config.EnvironmentSnapshotRoot().string() + " in the environment";
            return false;
        }
    }
    catch (const std::runtime_error& error)
    {
        result.reason = error.what();
        return false;
    }
    return true;
}

bool OuterInvoker::RunOrchestrator(InvocationResult& result)
{
    try
    {
        const CommandResult orchestrated = _environment.RunAs(_config.principal, _config.orchestratorCommand);
        LogCommandOutput(_logger, orchestrated.output);
        if (false == orchestrated.Succeeded())
        {
            _logger->warn("Orchestrator exited with status {}", orchestrated.exitCode);
        }
    }
    catch (const std::runtime_error& error)
    {
        result.reason = error.what();
        return false;
    }
    return true;
}

void OuterInvoker::InspectResult(const std::optional<fs::path>& previousSnapshot, InvocationResult& result) const
{
    const std::optional<fs::path> latestSnapshot = FindLatestSnapshot(_config.HostSnapshotRoot());
    if (true == latestSnapshot.has_value())
    {
        result.directory = latestSnapshot.value();
    }

    const bool isNewSnapshot = (true == latestSnapshot.has_value()) &&
                               ((false == previousSnapshot.has_value()) || (latestSnapshot.value() != previousSnapshot.value()));
    if ((false == isNewSnapshot) || (false == SnapshotVerifier::IsVerified(latestSnapshot.value())))
    {
        result.reason = UnverifiedBackupReason;
        return;
    }

    result.succeeded = true;
    result.contents = ListContents(latestSnapshot.value());
}

std::vector<ArtifactRecord> OuterInvoker::ListContents(const fs::path& snapshotDirectory) const
{
    std::vector<ArtifactRecord> contents;
    std::error_code errorCode;
    for (const auto& entry : fs::directory_iterator(snapshotDirectory, errorCode))
    {
        std::error_code entryError;
        if (false == entry.is_regular_file(entryError))
        {
            continue;
        }

        const std::optional<FileFingerprint> fingerprint = _fileHasher.Fingerprint(entry.path());
        if (true == fingerprint.has_value())
        {
            contents.push_back({entry.path().filename().string(), fingerprint->size, fingerprint->hash});
        }
        else
        {
            contents.push_back({entry.path().filename().string(), 0, {}});
        }
    }

    std::sort(contents.begin(), contents.end(), [](const ArtifactRecord& left, const ArtifactRecord& right) { return left.name < right.name; });
    return contents;
}

void OuterInvoker::Record(TriggerSource triggerSource, const std::string& startedAt, std::int64_t durationMs, const InvocationResult& result)
{
    if (nullptr == _runHistory)
    {
        return;
    }

    RunRecord runRecord{};
    runRecord.trigger = triggerSource;
    runRecord.startedAt = startedAt;
    runRecord.durationMs = durationMs;
    runRecord.succeeded = result.succeeded;
    runRecord.reason = result.reason;
    runRecord.snapshotDirectory = result.directory.string();
    runRecord.artifacts = result.contents;

    if (false == _runHistory->RecordRun(runRecord))
    {
        _logger->warn("Could not record backup run in history");
    }
}
