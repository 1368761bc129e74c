#include "ChangeWatcher/CommandWatchBackend.hpp"

#include "AutoBackup/BackupErrors.hpp"

#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace
{
bool IsInotifyEventName(const std::string& name)
{
    static const char* const KnownEvents[] = {"ACCESS", "MODIFY", "ATTRIB", "CLOSE_WRITE", "CLOSE_NOWRITE", "CLOSE", "OPEN",
                                              "MOVED_TO", "MOVED_FROM", "MOVE", "MOVE_SELF", "CREATE", "DELETE", "DELETE_SELF",
                                              "UNMOUNT", "ISDIR"};
    for (const char* knownEvent : KnownEvents)
    {
        if (name == knownEvent)
        {
            return true;
        }
    }
    return false;
}
}

CommandWatchBackend::CommandWatchBackend(std::vector<std::string> helperCommand, std::vector<std::string> teardownCommand,
                                         CommandRunner& commandRunner, std::shared_ptr<spdlog::logger> logger)
    : _helperCommand(std::move(helperCommand)), _teardownCommand(std::move(teardownCommand)), _commandRunner(commandRunner),
      _logger(std::move(logger))
{
}

CommandWatchBackend::~CommandWatchBackend()
{
    Close();
}

void CommandWatchBackend::Open(const fs::path& rootPath)
{
    Close();

    try
    {
        _helper.emplace(ChildProcess::Spawn(_helperCommand));
    }
    catch (const std::system_error& error)
    {
        throw WatchBackendError(std::string("Cannot start watcher helper: ") + error.what());
    }
    catch (const std::invalid_argument& error)
    {
        throw WatchBackendError(std::string("Cannot start watcher helper: ") + error.what());
    }
    _logger->info("Watcher helper started (pid {}) for {}", _helper->Pid(), rootPath.string());
}

WaitStatus CommandWatchBackend::WaitForChanges(std::chrono::milliseconds timeout, ChangeBatch& batch)
{
    if (false == _helper.has_value())
    {
        throw WatchBackendError("Watcher helper is not running");
    }

    ReadStatus status = ReadStatus::Timeout;
    try
    {
        status = _helper->Read(_pendingOutput, timeout);
    }
    catch (const std::system_error& error)
    {
        throw WatchBackendError(std::string("Reading watcher helper output failed: ") + error.what());
    }

    if (ReadStatus::Closed == status)
    {
        int exitCode = -1;
        try
        {
            exitCode = _helper->Wait();
        }
        catch (const std::system_error& error)
        {
            _logger->warn("Cannot reap watcher helper: {}", error.what());
        }
        _helper.reset();
        throw WatchBackendError("Watcher helper exited with status " + std::to_string(exitCode));
    }
    if (ReadStatus::Timeout == status)
    {
        return WaitStatus::Timeout;
    }

    batch.events.clear();
    std::size_t lineEnd = _pendingOutput.find('\n');
    while (std::string::npos != lineEnd)
    {
        const std::string line = _pendingOutput.substr(0, lineEnd);
        _pendingOutput.erase(0, lineEnd + 1);

        const std::optional<ChangeEvent> event = ParseLine(line);
        if (true == event.has_value())
        {
            batch.events.push_back(event.value());
        }
        else if (false == line.empty())
        {
            _logger->debug("watcher: {}", line);
        }
        lineEnd = _pendingOutput.find('\n');
    }

    return batch.events.empty() ? WaitStatus::Timeout : WaitStatus::Changes;
}

void CommandWatchBackend::Close() noexcept
{
    if (true == _helper.has_value())
    {
        try
        {
            _helper->Terminate();
        }
        catch (const std::system_error& error)
        {
            _logger->warn("Cannot stop watcher helper: {}", error.what());
        }
        _helper.reset();
        _logger->info("Watcher helper stopped");
    }
    _pendingOutput.clear();
    RunTeardown();
}

std::optional<ChangeEvent> CommandWatchBackend::ParseLine(const std::string& line)
{
    if (line == ChangeMarker)
    {
        return ChangeEvent{ChangeEventType::Modified, {}};
    }

    std::istringstream tokens(line);
    std::string directory;
    std::string events;
    if (!(tokens >> directory >> events))
    {
        return std::nullopt;
    }

    std::string firstEvent;
    std::istringstream eventNames(events);
    bool recognized = false;
    for (std::string eventName; std::getline(eventNames, eventName, ',');)
    {
        if (false == IsInotifyEventName(eventName))
        {
            return std::nullopt;
        }
        if (("ISDIR" != eventName) && (true == firstEvent.empty()))
        {
            firstEvent = eventName;
        }
        recognized = true;
    }
    if (false == recognized)
    {
        return std::nullopt;
    }

    std::string name;
    std::getline(tokens >> std::ws, name);
    return ChangeEvent{StringToChangeEventType(firstEvent), fs::path(directory) / name};
}

void CommandWatchBackend::RunTeardown() noexcept
{
    if (true == _teardownCommand.empty())
    {
        return;
    }

    try
    {
        const CommandResult result = _commandRunner.Run(_teardownCommand);
        _logger->debug("Watcher teardown exited with status {}", result.exitCode);
    }
    catch (const std::runtime_error& error)
    {
        _logger->warn("Watcher teardown failed: {}", error.what());
    }
}
