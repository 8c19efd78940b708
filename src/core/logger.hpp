#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace skychart::core
{
    /// @brief Where log output goes and how much of it.
    struct LogConfig
    {
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
        std::filesystem::path file;     ///< Rotating log file; empty disables file logging
    };

    /// @brief Centralized logging facility for Skychart.
    ///
    /// Provides two separate loggers:
    /// - **SKYCHART** (core): catalog loading, drawing backend, render pass progress
    /// - **APP**: command-line driver, user-facing messages
    ///
    /// Both write to the same coloured console sink and, when configured, the
    /// same rotating log file. Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// Rotating file: 5 MB per file, 3 files kept.
        static constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
        static constexpr std::size_t kMaxFiles = 3;

        /// @brief Initialize both loggers.
        /// Must be called once at startup before any SKC_ macros are used.
        static void init(const LogConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("SKYCHART").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace skychart::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SKC_CORE_TRACE(...)    ::skychart::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SKC_CORE_DEBUG(...)    ::skychart::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SKC_CORE_INFO(...)     ::skychart::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SKC_CORE_WARN(...)     ::skychart::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SKC_CORE_ERROR(...)    ::skychart::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SKC_CORE_CRITICAL(...) ::skychart::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SKC_TRACE(...)         ::skychart::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SKC_DEBUG(...)         ::skychart::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define SKC_INFO(...)          ::skychart::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SKC_WARN(...)          ::skychart::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SKC_ERROR(...)         ::skychart::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SKC_CRITICAL(...)      ::skychart::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
