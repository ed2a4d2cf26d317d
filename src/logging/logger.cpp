/**
 * @file logger.cpp
 * @brief spdlog backend of the command runner logging API
 */

#include "logging/logger.h"

#include <array>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace cmdrunner {
namespace logging {

namespace {

constexpr const char* kLoggerName = "cmdrunner";
constexpr size_t kBacktraceDepth = 32;

struct LevelInfo {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    const char* name;
    const char* alias;  // Accepted on input only (nullptr = none)
};

// Indexed by LogLevel
constexpr std::array<LevelInfo, 7> kLevels{{
    {LogLevel::Trace, spdlog::level::trace, "trace", nullptr},
    {LogLevel::Debug, spdlog::level::debug, "debug", nullptr},
    {LogLevel::Info, spdlog::level::info, "info", nullptr},
    {LogLevel::Warn, spdlog::level::warn, "warn", "warning"},
    {LogLevel::Error, spdlog::level::err, "error", "err"},
    {LogLevel::Critical, spdlog::level::critical, "critical", "fatal"},
    {LogLevel::Off, spdlog::level::off, "off", "none"},
}};

const LevelInfo& levelInfo(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < kLevels.size() ? kLevels[index] : kLevels[static_cast<size_t>(LogLevel::Info)];
}

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};
// Set while only the stderr bootstrap sink is installed
bool g_early = false;

std::vector<spdlog::sink_ptr> makeSinks(const LogConfig& config) {
    const auto level = levelInfo(config.level).spdlogLevel;
    std::vector<spdlog::sink_ptr> sinks;

    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }

    for (auto& sink : sinks) {
        sink->set_level(level);
    }
    return sinks;
}

// Caller holds g_init_mutex
void install(std::vector<spdlog::sink_ptr> sinks, const LogConfig& config, bool early) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(levelInfo(config.level).spdlogLevel);
    logger->set_pattern(config.pattern);
    logger->enable_backtrace(kBacktraceDepth);
    logger->flush_on(spdlog::level::err);

    spdlog::set_default_logger(logger);
    g_logger = std::move(logger);
    g_early = early;
    g_initialized.store(true, std::memory_order_release);
}

}  // namespace

bool initialize(const LogConfig& config) {
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);

        if (g_initialized.load(std::memory_order_acquire) && !g_early) {
            g_logger->set_level(levelInfo(config.level).spdlogLevel);
            g_logger->set_pattern(config.pattern);
            return true;
        }

        try {
            install(makeSinks(config), config, false);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
            return false;
        }
    }

    LOG_INFO("Logging initialized (level={})", levelToString(config.level));
    if (!config.filePath.empty()) {
        LOG_INFO("Log file: {} (max {}MB x {} backups)", config.filePath,
                 config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }

    try {
        install({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()}, LogConfig{}, true);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
    return true;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        SPDLOG_LOGGER_INFO(g_logger, "Logging shutdown");
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    g_early = false;
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (!logger) {
        return;
    }
    const auto spdlogLevel = levelInfo(level).spdlogLevel;
    logger->set_level(spdlogLevel);
    for (auto& sink : logger->sinks()) {
        sink->set_level(spdlogLevel);
    }
    LOG_DEBUG("Log level set to {}", levelToString(level));
}

LogLevel getLevel() {
    if (!g_logger) {
        return LogLevel::Info;
    }
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == g_logger->level()) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (!g_initialized.load(std::memory_order_acquire) && !initialize()) {
        return nullptr;
    }
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    return levelInfo(level).name;
}

std::optional<LogLevel> tryParseLevel(std::string_view str) {
    std::string lower(str.size(), '\0');
    for (size_t i = 0; i < str.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    }

    for (const auto& entry : kLevels) {
        if (lower == entry.name || (entry.alias && lower == entry.alias)) {
            return entry.level;
        }
    }
    return std::nullopt;
}

}  // namespace logging
}  // namespace cmdrunner
