#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace skyradar::core
{
    /// @brief Sink and level selection for Logger::init().
    /// Use designated initializers: Logger::init({.enable_file = false});
    struct LoggerConfig
    {
        std::string log_file = "skyradar.log";
        bool enable_file = true;
        spdlog::level::level_enum level = spdlog::level::trace;
    };

    /// @brief Centralized logging facility for SkyRadar.
    ///
    /// Provides two separate loggers:
    /// - **SKYRADAR** (core): catalog loading, scene composition internals
    /// - **APP**: the embedding application / demo driver
    ///
    /// Both write to colored console output and, unless disabled, a rotating
    /// log file. The host application owns the lifetime: call init() once
    /// from main() before any logging, shutdown() once at exit.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console (+ optional file) sinks.
        /// Until it runs, the SKR_ macros log to a silent null sink.
        static void init(const LoggerConfig& config = {});

        /// @brief True between init() and shutdown().
        [[nodiscard]] static bool is_initialized();

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library-internal logger ("SKYRADAR").
        /// Before init() (or after shutdown()) this is a logger with a null sink.
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP"). Null-sink before init().
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace skyradar::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SKR_CORE_TRACE(...)    ::skyradar::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SKR_CORE_INFO(...)     ::skyradar::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SKR_CORE_WARN(...)     ::skyradar::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SKR_CORE_ERROR(...)    ::skyradar::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SKR_CORE_CRITICAL(...) ::skyradar::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SKR_TRACE(...)         ::skyradar::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SKR_INFO(...)          ::skyradar::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SKR_WARN(...)          ::skyradar::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SKR_ERROR(...)         ::skyradar::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SKR_CRITICAL(...)      ::skyradar::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
