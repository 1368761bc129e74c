#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

/**
 * @brief Outcome of waiting for output from a child process.
 */
enum class ReadStatus
{
    Data,    /**< Output was appended to the buffer */
    Timeout, /**< Nothing arrived before the timeout */
    Closed   /**< The child closed its output, usually because it exited */
};

/**
 * @brief RAII handle for a spawned child process whose stdout and stderr are captured through one pipe.
 *
 * A child that is still running when the handle is destroyed is terminated and reaped.
 */
class ChildProcess
{
  public:
    /**
     * @brief Spawn a command. The first element is looked up in PATH.
     *
     * A command that cannot be executed exits with status 127.
     *
     * @param[in] arguments Program and arguments
     * @return Handle for the running child
     * @throws std::system_error if the pipe or fork fails
     * @throws std::invalid_argument if arguments is empty
     */
    static ChildProcess Spawn(const std::vector<std::string>& arguments);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    /**
     * @brief Wait up to timeout for output and append whatever is available.
     *
     * @param[in,out] output Buffer receiving the output
     * @param[in] timeout Maximum time to wait
     * @return Whether data arrived, the wait timed out, or the output closed
     */
    ReadStatus Read(std::string& output, std::chrono::milliseconds timeout);

    /**
     * @brief Read until the child closes its output.
     *
     * @return All remaining output
     */
    std::string ReadAll();

    /**
     * @brief Wait for the child to exit.
     *
     * @return Exit status, or 128 + signal number when killed by a signal
     */
    int Wait();

    /**
     * @brief Send SIGTERM, then SIGKILL if the child does not exit within the grace period.
     *
     * @param[in] gracePeriod Time allowed between the two signals
     * @return Exit status as reported by Wait()
     */
    int Terminate(std::chrono::milliseconds gracePeriod = std::chrono::milliseconds(2000));

    bool Running() const;
    pid_t Pid() const;

  private:
    ChildProcess(pid_t pid, int outputDescriptor);

    void CloseOutput() noexcept;
    void Release() noexcept;

    pid_t _pid;
    int _outputDescriptor;
    int _exitStatus;
};
