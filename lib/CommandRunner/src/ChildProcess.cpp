#include "CommandRunner/ChildProcess.hpp"

#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
constexpr int ExecFailureExitCode = 127;
constexpr int SignalExitCodeBase = 128;
constexpr std::size_t ReadBufferSize = 4096;
constexpr std::chrono::milliseconds TerminatePollInterval{20};

int DecodeWaitStatus(int status)
{
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return SignalExitCodeBase + WTERMSIG(status);
    }
    return status;
}
}

ChildProcess ChildProcess::Spawn(const std::vector<std::string>& arguments)
{
    if (true == arguments.empty())
    {
        throw std::invalid_argument("Cannot spawn an empty command");
    }

    int pipeDescriptors[2] = {-1, -1};
    if (0 != pipe2(pipeDescriptors, O_CLOEXEC))
    {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }

    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (const auto& argument : arguments)
    {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (0 > pid)
    {
        const int forkError = errno;
        close(pipeDescriptors[0]);
        close(pipeDescriptors[1]);
        throw std::system_error(forkError, std::generic_category(), "fork");
    }

    if (0 == pid)
    {
        // Child: only async-signal-safe calls until exec. The parent may block
        // termination signals for sigwait; the child must not inherit that.
        sigset_t unblocked;
        sigemptyset(&unblocked);
        sigprocmask(SIG_SETMASK, &unblocked, nullptr);
        dup2(pipeDescriptors[1], STDOUT_FILENO);
        dup2(pipeDescriptors[1], STDERR_FILENO);
        const int nullDescriptor = open("/dev/null", O_RDONLY);
        if (0 <= nullDescriptor)
        {
            dup2(nullDescriptor, STDIN_FILENO);
        }
        execvp(argv[0], argv.data());
        _exit(ExecFailureExitCode);
    }

    close(pipeDescriptors[1]);
    return ChildProcess(pid, pipeDescriptors[0]);
}

ChildProcess::ChildProcess(pid_t pid, int outputDescriptor) : _pid(pid), _outputDescriptor(outputDescriptor), _exitStatus(-1)
{
}

ChildProcess::~ChildProcess()
{
    Release();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : _pid(std::exchange(other._pid, -1)), _outputDescriptor(std::exchange(other._outputDescriptor, -1)), _exitStatus(other._exitStatus)
{
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept
{
    if (this != &other)
    {
        Release();
        _pid = std::exchange(other._pid, -1);
        _outputDescriptor = std::exchange(other._outputDescriptor, -1);
        _exitStatus = other._exitStatus;
    }
    return *this;
}

ReadStatus ChildProcess::Read(std::string& output, std::chrono::milliseconds timeout)
{
    if (0 > _outputDescriptor)
    {
        return ReadStatus::Closed;
    }

    pollfd descriptor{_outputDescriptor, POLLIN, 0};
    const int ready = poll(&descriptor, 1, static_cast<int>(timeout.count()));
    if (0 == ready)
    {
        return ReadStatus::Timeout;
    }
    if (0 > ready)
    {
        if (EINTR == errno)
        {
            return ReadStatus::Timeout;
        }
        throw std::system_error(errno, std::generic_category(), "poll");
    }

    char buffer[ReadBufferSize];
    const ssize_t bytesRead = read(_outputDescriptor, buffer, sizeof(buffer));
    if (0 < bytesRead)
    {
        output.append(buffer, static_cast<std::size_t>(bytesRead));
        return ReadStatus::Data;
    }
    if ((0 > bytesRead) && (EINTR == errno))
    {
        return ReadStatus::Timeout;
    }

    CloseOutput();
    return ReadStatus::Closed;
}

std::string ChildProcess::ReadAll()
{
    std::string output;
    while (ReadStatus::Closed != Read(output, std::chrono::milliseconds(-1)))
    {
    }
    return output;
}

int ChildProcess::Wait()
{
    if (0 >= _pid)
    {
        return _exitStatus;
    }

    int status = 0;
    pid_t result = -1;
    do
    {
        result = waitpid(_pid, &status, 0);
    } while ((0 > result) && (EINTR == errno));

    if (0 > result)
    {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }

    _exitStatus = DecodeWaitStatus(status);
    _pid = -1;
    CloseOutput();
    return _exitStatus;
}

int ChildProcess::Terminate(std::chrono::milliseconds gracePeriod)
{
    if (0 >= _pid)
    {
        return _exitStatus;
    }

    kill(_pid, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + gracePeriod;
    while (std::chrono::steady_clock::now() < deadline)
    {
        int status = 0;
        const pid_t result = waitpid(_pid, &status, WNOHANG);
        if (_pid == result)
        {
            _exitStatus = DecodeWaitStatus(status);
            _pid = -1;
            CloseOutput();
            return _exitStatus;
        }
        if (0 > result && EINTR != errno)
        {
            break;
        }
        std::this_thread::sleep_for(TerminatePollInterval);
    }

    kill(_pid, SIGKILL);
    return Wait();
}

bool ChildProcess::Running() const
{
    return 0 < _pid;
}

pid_t ChildProcess::Pid() const
{
    return _pid;
}

void ChildProcess::CloseOutput() noexcept
{
    if (0 <= _outputDescriptor)
    {
        close(_outputDescriptor);
        _outputDescriptor = -1;
    }
}

void ChildProcess::Release() noexcept
{
    if (0 < _pid)
    {
        try
        {
            Terminate();
        }
        catch (const std::system_error&)
        {
            _pid = -1;
        }
    }
    CloseOutput();
}
