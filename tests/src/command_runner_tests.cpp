/**
 * @file command_runner_tests.cpp
 * @brief Tests for running external commands and supervising child processes.
 */
#include "CommandRunner/ChildProcess.hpp"
#include "CommandRunner/CommandRunner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;

TEST(PosixCommandRunnerTest, CapturesOutputAndExitCode)
{
    PosixCommandRunner commandRunner;

    const CommandResult result = commandRunner.Run({"/bin/sh", "-c", "echo hello; echo oops >&2; exit 4"});

    EXPECT_EQ(4, result.exitCode);
    EXPECT_FALSE(result.Succeeded());
    EXPECT_NE(std::string::npos, result.output.find("hello\n"));
    EXPECT_NE(std::string::npos, result.output.find("oops\n"));
}

TEST(PosixCommandRunnerTest, SuccessfulCommand)
{
    PosixCommandRunner commandRunner;

    const CommandResult result = commandRunner.Run({"echo", "export:workflow"});

    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ("export:workflow\n", result.output);
}

TEST(PosixCommandRunnerTest, MissingExecutableExitsWith127)
{
    PosixCommandRunner commandRunner;

    const CommandResult result = commandRunner.Run({"autobackup-test-no-such-binary"});

    EXPECT_EQ(127, result.exitCode);
}

TEST(PosixCommandRunnerTest, EmptyCommandIsRejected)
{
    PosixCommandRunner commandRunner;

    EXPECT_THROW(commandRunner.Run({}), std::runtime_error);
}

TEST(PosixCommandRunnerTest, FormatsCommandLine)
{
    EXPECT_EQ("docker exec -u node n8n autobackup", FormatCommandLine({"docker", "exec", "-u", "node", "n8n", "autobackup"}));
    EXPECT_EQ("", FormatCommandLine({}));
}

TEST(ChildProcessTest, StreamsOutputIncrementally)
{
    ChildProcess child = ChildProcess::Spawn({"/bin/sh", "-c", "echo first; sleep 30"});

    std::string output;
    for (int attempt = 0; (attempt < 50) && (std::string::npos == output.find('\n')); ++attempt)
    {
        ASSERT_NE(ReadStatus::Closed, child.Read(output, 100ms));
    }
    EXPECT_EQ("first\n", output);
    EXPECT_TRUE(child.Running());

    EXPECT_EQ(128 + SIGTERM, child.Terminate());
    EXPECT_FALSE(child.Running());
}

TEST(ChildProcessTest, ReadTimesOutWhileChildIsQuiet)
{
    ChildProcess child = ChildProcess::Spawn({"sleep", "30"});

    std::string output;
    EXPECT_EQ(ReadStatus::Timeout, child.Read(output, 20ms));
    EXPECT_TRUE(output.empty());
}

TEST(ChildProcessTest, IgnoredTerminationEscalatesToKill)
{
    ChildProcess child = ChildProcess::Spawn({"/bin/sh", "-c", "trap '' TERM; echo ready; while true; do sleep 1; done"});

    std::string output;
    for (int attempt = 0; (attempt < 50) && (std::string::npos == output.find('\n')); ++attempt)
    {
        child.Read(output, 100ms);
    }

    EXPECT_EQ(128 + SIGKILL, child.Terminate(200ms));
}

TEST(ChildProcessTest, MovedFromProcessIsInert)
{
    ChildProcess child = ChildProcess::Spawn({"true"});
    ChildProcess moved = std::move(child);

    EXPECT_FALSE(child.Running());
    EXPECT_EQ(0, moved.Wait());
}

TEST(ChildProcessTest, EmptyArgumentsAreRejected)
{
    EXPECT_THROW(ChildProcess::Spawn({}), std::invalid_argument);
}
