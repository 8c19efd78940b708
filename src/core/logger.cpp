/// @file logger.cpp
/// @brief Logger implementation: console sink plus optional rotating file, shared by both loggers.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <string>
#include <vector>

namespace skychart::core
{

namespace
{

constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const LogConfig& config)
{
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    console_sink->set_level(config.console_level);
    sinks.push_back(console_sink);

    if (!config.file.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file.string(), kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        file_sink->set_level(config.file_level);
        sinks.push_back(file_sink);
    }

    // Sinks are built first so a log file that cannot be opened leaves the
    // previous loggers in place.
    if (s_core_logger || s_app_logger)
    {
        shutdown();
    }

    // The loggers pass everything the most verbose sink wants; sinks filter further.
    const auto level = config.file.empty() ? config.console_level
                                           : std::min(config.console_level, config.file_level);

    s_core_logger = make_logger("SKYCHART", sinks, level);
    s_app_logger = make_logger("APP", sinks, level);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace skychart::core
