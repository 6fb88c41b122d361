/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace skyradar::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

// Stands in for both loggers until init() runs
std::shared_ptr<spdlog::logger>& null_logger()
{
    static std::shared_ptr<spdlog::logger> logger =
        std::make_shared<spdlog::logger>("SKYRADAR_NULL", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

} // anonymous namespace

void Logger::init(const LoggerConfig& config)
{
    if (is_initialized())
    {
        return;
    }

    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    sinks.push_back(console_sink);

    if (config.enable_file)
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }

    s_core_logger = make_logger("SKYRADAR", sinks, config.level);
    s_app_logger  = make_logger("APP", sinks, config.level);
}

bool Logger::is_initialized()
{
    return s_core_logger != nullptr && s_app_logger != nullptr;
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
    return s_core_logger ? s_core_logger : null_logger();
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger ? s_app_logger : null_logger();
}

} // namespace skyradar::core
