/**
 * @file logger.h
 * @brief Structured logging API for the command runner service
 *
 * Provides a unified logging interface using spdlog.
 * Supports console output, rotating file output, and configurable log levels.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace cmdrunner {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Very detailed debugging information
    Debug,     // Debug information
    Info,      // General information
    Warn,      // Warnings
    Error,     // Errors
    Critical,  // Critical errors
    Off        // Disable logging
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling it again after a successful initialization only updates level and
 * pattern; sinks are kept.
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Lightweight initialization for logging before the config file is read.
 * A later initialize() call replaces the stderr sink with the configured ones.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initializeEarly();

/**
 * @brief Shutdown the logging system
 *
 * Flushes all pending log messages and releases resources.
 */
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();

/**
 * @brief Flush all pending log messages
 */
void flush();

/**
 * @brief Get the underlying spdlog logger
 *
 * Initializes with defaults on first use.
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel (strict)
 *
 * Case-insensitive; accepts "warning", "err", "fatal" and "none" as aliases.
 *
 * @return The level, or std::nullopt for an unrecognized name
 */
std::optional<LogLevel> tryParseLevel(std::string_view str);

}  // namespace logging
}  // namespace cmdrunner

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

// ============================================================
// Logging macros - Use these instead of calling spdlog directly
// ============================================================

#define LOG_TRACE(...)                                 \
    do {                                               \
        auto logger = cmdrunner::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_DEBUG(...)                                 \
    do {                                               \
        auto logger = cmdrunner::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_INFO(...)                                  \
    do {                                               \
        auto logger = cmdrunner::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_WARN(...)                                  \
    do {                                               \
        auto logger = cmdrunner::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_ERROR(...)                                 \
    do {                                               \
        auto logger = cmdrunner::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = cmdrunner::logging::getLogger();   \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

/**
 * @brief Log if condition is true
 */
#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)
