#include "AutoBackup/ExecutionEnvironment.hpp"

#include "AutoBackup/Logging.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace
{
constexpr int FailureExitCode = 1;

fs::perms ParseOctalMode(const std::string& mode)
{
    return static_cast<fs::perms>(std::stoul(mode, nullptr, 8)) & fs::perms::mask;
}
}

ContainerExecutionEnvironment::ContainerExecutionEnvironment(CommandRunner& commandRunner, std::string containerName, std::string engine)
    : _commandRunner(commandRunner), _containerName(std::move(containerName)), _engine(std::move(engine))
{
}

CommandResult ContainerExecutionEnvironment::CreateDirectory(const fs::path& path, const std::string& mode)
{
    CommandResult result = _commandRunner.Run({_engine, "exec", _containerName, "mkdir", "-p", path.string()});
    if ((false == result.Succeeded()) || (true == mode.empty()))
    {
        return result;
    }
    return _commandRunner.Run({_engine, "exec", _containerName, "chmod", mode, path.string()});
}

CommandResult ContainerExecutionEnvironment::RunAs(const std::string& principal, const std::vector<std::string>& arguments)
{
    std::vector<std::string> command = {_engine, "exec", "-u", principal, _containerName};
    command.insert(command.end(), arguments.begin(), arguments.end());
    return _commandRunner.Run(command);
}

CommandResult ContainerExecutionEnvironment::CopyInto(const fs::path& hostPath, const fs::path& environmentPath)
{
    return _commandRunner.Run({_engine, "cp", hostPath.string(), _containerName + ":" + environmentPath.string()});
}

std::string ContainerExecutionEnvironment::Describe() const
{
    return _engine + " container " + _containerName;
}

HostExecutionEnvironment::HostExecutionEnvironment(CommandRunner& commandRunner, std::shared_ptr<spdlog::logger> logger)
    : _commandRunner(commandRunner), _logger(std::move(logger))
{
    if (nullptr == _logger)
    {
        _logger = CreateNullLogger("host-environment");
    }
}

CommandResult HostExecutionEnvironment::CreateDirectory(const fs::path& path, const std::string& mode)
{
    std::error_code errorCode;
    fs::create_directories(path, errorCode);
    if (0 != errorCode.value())
    {
        return CommandResult{FailureExitCode, "mkdir " + path.string() + ": " + errorCode.message()};
    }

    if (false == mode.empty())
    {
        try
        {
            fs::permissions(path, ParseOctalMode(mode), fs::perm_options::replace, errorCode);
        }
        catch (const std::logic_error&)
        {
            return CommandResult{FailureExitCode, "invalid mode " + mode};
        }
        if (0 != errorCode.value())
        {
            return CommandResult{FailureExitCode, "chmod " + path.string() + ": " + errorCode.message()};
        }
    }
    return CommandResult{0, {}};
}

CommandResult HostExecutionEnvironment::RunAs(const std::string& principal, const std::vector<std::string>& arguments)
{
    _logger->debug("Host mode runs {} as the invoking user (uid {}), not as principal {}", FormatCommandLine(arguments), geteuid(),
                   principal);
    return _commandRunner.Run(arguments);
}

CommandResult HostExecutionEnvironment::CopyInto(const fs::path& hostPath, const fs::path& environmentPath)
{
    std::error_code errorCode;
    fs::copy_file(hostPath, environmentPath, fs::copy_options::overwrite_existing, errorCode);
    if (0 != errorCode.value())
    {
        return CommandResult{FailureExitCode, "copy " + hostPath.string() + ": " + errorCode.message()};
    }
    return CommandResult{0, {}};
}

std::string HostExecutionEnvironment::Describe() const
{
    return "host";
}
