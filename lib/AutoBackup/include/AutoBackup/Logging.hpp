#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

/**
 * @brief Get or create the colored console logger used by the command-line front end.
 *
 * @param[in] name Logger name
 * @param[in] verbose Enable debug level output
 * @return Shared logger instance
 */
std::shared_ptr<spdlog::logger> CreateConsoleLogger(const std::string& name, bool verbose);

/**
 * @brief Create an unregistered logger that discards everything.
 *
 * @param[in] name Logger name
 * @return Shared logger instance
 */
std::shared_ptr<spdlog::logger> CreateNullLogger(const std::string& name);
