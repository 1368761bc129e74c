#pragma once

#include "ChangeWatcher/WatchBackend.hpp"
#include "CommandRunner/ChildProcess.hpp"
#include "CommandRunner/CommandRunner.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

/**
 * @brief Backend driven by an external watcher helper, such as a helper
 * container running `inotifywait -m -r`.
 *
 * Every read that yields event lines is one batch. Recognized lines are
 * inotifywait event lines (`<dir> <EVENT[,EVENT]> <name>`) and the plain
 * marker `CHANGE_DETECTED`; anything else is helper chatter and is only
 * logged. The helper is owned for the lifetime of the session: Close()
 * terminates it and runs the teardown command, which also runs before every
 * Open() to clear leftovers of an earlier session.
 */
class CommandWatchBackend : public WatchBackend
{
  public:
    static constexpr const char* ChangeMarker = "CHANGE_DETECTED";

    /**
     * @param[in] helperCommand Helper to spawn, the watch root is not appended
     * @param[in] teardownCommand Command removing helper resources, may be empty
     * @param[in] commandRunner Runner for the teardown command
     * @param[in] logger Logger for helper output
     */
    CommandWatchBackend(std::vector<std::string> helperCommand, std::vector<std::string> teardownCommand, CommandRunner& commandRunner,
                        std::shared_ptr<spdlog::logger> logger);
    ~CommandWatchBackend() override;

    CommandWatchBackend(const CommandWatchBackend&) = delete;
    CommandWatchBackend& operator=(const CommandWatchBackend&) = delete;

    void Open(const fs::path& rootPath) override;
    WaitStatus WaitForChanges(std::chrono::milliseconds timeout, ChangeBatch& batch) override;
    void Close() noexcept override;

    /**
     * @brief Interpret one line of helper output.
     *
     * @param[in] line Output line without newline
     * @return The change it reports, std::nullopt for chatter
     */
    static std::optional<ChangeEvent> ParseLine(const std::string& line);

  private:
    void RunTeardown() noexcept;

    std::vector<std::string> _helperCommand;
    std::vector<std::string> _teardownCommand;
    CommandRunner& _commandRunner;
    std::shared_ptr<spdlog::logger> _logger;
    std::optional<ChildProcess> _helper;
    std::string _pendingOutput;
};
