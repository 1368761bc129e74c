#pragma once

#include "CommandRunner/CommandRunner.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace fs = std::filesystem;

/**
 * @brief Isolated environment the orchestrator runs in.
 *
 * Every operation is an opaque pass/fail command whose output is captured.
 */
class ExecutionEnvironment
{
  public:
    virtual ~ExecutionEnvironment() = default;

    /**
     * @brief Create a directory (and parents) inside the environment.
     *
     * @param[in] path Directory inside the environment
     * @param[in] mode Octal permission string applied to the directory, empty to keep the default
     */
    virtual CommandResult CreateDirectory(const fs::path& path, const std::string& mode) = 0;

    /**
     * @brief Run a command inside the environment as the given principal.
     */
    virtual CommandResult RunAs(const std::string& principal, const std::vector<std::string>& arguments) = 0;

    /**
     * @brief Copy a host file into the environment.
     */
    virtual CommandResult CopyInto(const fs::path& hostPath, const fs::path& environmentPath) = 0;

    /**
     * @brief Short description for log output.
     */
    virtual std::string Describe() const = 0;
};

/**
 * @brief Environment backed by a running container, driven through the container engine CLI.
 */
class ContainerExecutionEnvironment : public ExecutionEnvironment
{
  public:
    /**
     * @param[in] commandRunner Runner for engine commands
     * @param[in] containerName Target container
     * @param[in] engine Container engine executable, for example docker or podman
     */
    ContainerExecutionEnvironment(CommandRunner& commandRunner, std::string containerName, std::string engine = "docker");

    CommandResult CreateDirectory(const fs::path& path, const std::string& mode) override;
    CommandResult RunAs(const std::string& principal, const std::vector<std::string>& arguments) override;
    CommandResult CopyInto(const fs::path& hostPath, const fs::path& environmentPath) override;
    std::string Describe() const override;

  private:
    CommandRunner& _commandRunner;
    std::string _containerName;
    std::string _engine;
};

/**
 * @brief Environment that is the host itself. The principal is not switched;
 * the orchestrator's own identity check rejects a wrong user.
 */
class HostExecutionEnvironment : public ExecutionEnvironment
{
  public:
    /**
     * @param[in] commandRunner Runs every command directly on the host
     * @param[in] logger Receives a debug note whenever a principal is requested, defaults to a null logger
     */
    explicit HostExecutionEnvironment(CommandRunner& commandRunner, std::shared_ptr<spdlog::logger> logger = nullptr);

    CommandResult CreateDirectory(const fs::path& path, const std::string& mode) override;
    CommandResult RunAs(const std::string& principal, const std::vector<std::string>& arguments) override;
    CommandResult CopyInto(const fs::path& hostPath, const fs::path& environmentPath) override;
    std::string Describe() const override;

  private:
    CommandRunner& _commandRunner;
    std::shared_ptr<spdlog::logger> _logger;
};
