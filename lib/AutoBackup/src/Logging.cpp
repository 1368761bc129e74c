#include "AutoBackup/Logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{
constexpr const char* ConsolePattern = "[%Y-%m-%d %H:%M:%S] [%^%l%$] %v";
}

std::shared_ptr<spdlog::logger> CreateConsoleLogger(const std::string& name, bool verbose)
{
    std::shared_ptr<spdlog::logger> logger = spdlog::get(name);
    if (nullptr == logger)
    {
        logger = spdlog::stdout_color_mt(name);
    }

    logger->set_pattern(ConsolePattern);
    logger->set_level((true == verbose) ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::info);
    return logger;
}

std::shared_ptr<spdlog::logger> CreateNullLogger(const std::string& name)
{
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}
