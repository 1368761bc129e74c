#pragma once

#include <string>
#include <vector>

/**
 * @brief Exit status and combined output of a finished command.
 */
struct CommandResult
{
    int exitCode;       /**< Process exit status, 127 when the program could not be executed */
    std::string output; /**< Captured stdout and stderr */

    bool Succeeded() const
    {
        return 0 == exitCode;
    }
};

/**
 * @brief Runs an external command to completion and captures its output.
 */
class CommandRunner
{
  public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command synchronously.
     *
     * @param[in] arguments Program and arguments
     * @return Exit status and output
     * @throws std::runtime_error if the command cannot be started
     */
    virtual CommandResult Run(const std::vector<std::string>& arguments) = 0;
};

/**
 * @brief CommandRunner backed by fork/exec.
 */
class PosixCommandRunner : public CommandRunner
{
  public:
    CommandResult Run(const std::vector<std::string>& arguments) override;
};

/**
 * @brief Join arguments into one line for log output.
 *
 * @param[in] arguments Program and arguments
 * @return Space separated command line
 */
std::string FormatCommandLine(const std::vector<std::string>& arguments);
