#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>

/**
 * Log Manager - centralized logging using spdlog
 * Owns the "MqttPlayerBridge" logger (console + rotating file sinks)
 */
class LogManager
{
public:
    static constexpr const char* kLoggerName = "MqttPlayerBridge";

    static LogManager& instance();

    // Initialize logging system. log.properties is looked up in
    // configDirectory first, then in logDirectory.
    void initialize(const std::string& logDirectory = "log", const std::string& configDirectory = "config");
    void shutdown();

    void flush();

private:
    LogManager() = default;
    ~LogManager() = default;
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    static spdlog::level::level_enum parseLevel(std::string name, spdlog::level::level_enum fallback);

    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_logDirectory;
    bool m_initialized = false;
};

// Convenience macros for easy logging. These forward source location to spdlog so
// sink patterns using [%s:%#] get populated.
#define LOG_TRACE(...) do { auto _lg = spdlog::get(LogManager::kLoggerName); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::trace, __VA_ARGS__); } while(0)
#define LOG_DEBUG(...) do { auto _lg = spdlog::get(LogManager::kLoggerName); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::debug, __VA_ARGS__); } while(0)
#define LOG_INFO(...)  do { auto _lg = spdlog::get(LogManager::kLoggerName); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::info, __VA_ARGS__); } while(0)
#define LOG_WARN(...)  do { auto _lg = spdlog::get(LogManager::kLoggerName); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::warn,  __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { auto _lg = spdlog::get(LogManager::kLoggerName); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::err, __VA_ARGS__); } while(0)
#define LOG_CRITICAL(...) do { auto _lg = spdlog::get(LogManager::kLoggerName); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::critical, __VA_ARGS__); } while(0)
