#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct ServiceConfig {
    // Device directory
    int deviceDbUpdateInterval = DaemonConstants::DEFAULT_DEVICE_DB_UPDATE_INTERVAL_SEC;  // seconds
    std::optional<std::string> deviceNameFilter;  // Regex restricting the bulk refresh
    int readyPollInterval = DaemonConstants::DEFAULT_READY_POLL_INTERVAL_MS;  // milliseconds
    std::string deviceFile = DaemonConstants::DEFAULT_DEVICE_FILE;

    // Lifecycle
    int exitMaxWait = DaemonConstants::DEFAULT_EXIT_MAX_WAIT_SEC;  // seconds
    size_t maxDefaultExecutorThreads = DaemonConstants::DEFAULT_EXECUTOR_THREADS;

    // Logging: the level stays a name until startup validates it
    std::string logLevel = "info";
    cmdrunner::logging::LogConfig logging;

    // Stats snapshot file (empty = disabled)
    std::string statsFile;
    int statsInterval = DaemonConstants::DEFAULT_STATS_INTERVAL_SEC;  // seconds

    std::chrono::seconds deviceDbUpdatePeriod() const {
        return std::chrono::seconds(deviceDbUpdateInterval);
    }
    std::chrono::seconds exitMaxWaitDuration() const {
        return std::chrono::seconds(exitMaxWait);
    }
};

/**
 * @brief Load configuration from a JSON file.
 *
 * Missing keys keep their defaults.
 *
 * @return false if the file is missing or not valid JSON (outConfig then holds defaults)
 * @throws cmdrunner::ConfigError naming the key when a present key has the wrong type
 */
bool loadServiceConfig(const std::filesystem::path& configPath, ServiceConfig& outConfig,
                       bool verbose = true);

/**
 * @brief Apply a parsed JSON object on top of outConfig.
 *
 * @throws cmdrunner::ConfigError naming the key when a present key has the wrong type
 */
void applyServiceConfigJson(const nlohmann::json& j, ServiceConfig& outConfig, bool verbose);

/**
 * @brief Reject values the service cannot start with.
 *
 * @throws cmdrunner::ConfigError naming the offending key
 */
void validateServiceConfig(const ServiceConfig& config);

nlohmann::json serviceConfigToJson(const ServiceConfig& config);

#endif  // CONFIG_LOADER_H
