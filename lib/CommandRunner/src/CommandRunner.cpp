#include "CommandRunner/CommandRunner.hpp"

#include "CommandRunner/ChildProcess.hpp"

#include <stdexcept>
#include <system_error>

CommandResult PosixCommandRunner::Run(const std::vector<std::string>& arguments)
{
    if (true == arguments.empty())
    {
        throw std::runtime_error("Cannot run an empty command");
    }

    try
    {
        ChildProcess child = ChildProcess::Spawn(arguments);
        std::string output = child.ReadAll();
        const int exitCode = child.Wait();
        return CommandResult{exitCode, output};
    }
    catch (const std::system_error& error)
    {
        throw std::runtime_error("Failed to run " + FormatCommandLine(arguments) + ": " + error.what());
    }
}

std::string FormatCommandLine(const std::vector<std::string>& arguments)
{
    std::string commandLine;
    for (const auto& argument : arguments)
    {
        if (false == commandLine.empty())
        {
            commandLine += ' ';
        }
        commandLine += argument;
    }
    return commandLine;
}
