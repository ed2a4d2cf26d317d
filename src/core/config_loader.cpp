#include "core/config_loader.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <fstream>
#include <iostream>
#include <regex>

namespace {

// Reads key into out when present; a value of the wrong type is fatal
template <typename T>
void readKey(const nlohmann::json& j, const std::string& key, T& out,
             const std::string& prefix = "") {
    if (!j.contains(key)) {
        return;
    }
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw cmdrunner::ConfigError("Invalid value for '" + prefix + key + "': " + ex.what(),
                                     cmdrunner::ErrorCode::VALIDATION_INVALID_CONFIG);
    }
}

void applyLoggingSection(const nlohmann::json& logSection, cmdrunner::logging::LogConfig& config) {
    const std::string prefix = "logging.";
    readKey(logSection, "filePath", config.filePath, prefix);
    readKey(logSection, "maxFileSize", config.maxFileSize, prefix);
    readKey(logSection, "maxBackups", config.maxBackups, prefix);
    readKey(logSection, "consoleOutput", config.consoleOutput, prefix);
    readKey(logSection, "coloredOutput", config.coloredOutput, prefix);
    readKey(logSection, "pattern", config.pattern, prefix);
}

}  // namespace

void applyServiceConfigJson(const nlohmann::json& j, ServiceConfig& outConfig, bool verbose) {
    readKey(j, "deviceDbUpdateInterval", outConfig.deviceDbUpdateInterval);
    if (j.contains("deviceNameFilter")) {
        if (j["deviceNameFilter"].is_null()) {
            outConfig.deviceNameFilter.reset();
        } else {
            std::string filter;
            readKey(j, "deviceNameFilter", filter);
            outConfig.deviceNameFilter = filter;
        }
    }
    readKey(j, "readyPollInterval", outConfig.readyPollInterval);
    readKey(j, "deviceFile", outConfig.deviceFile);
    readKey(j, "exitMaxWait", outConfig.exitMaxWait);
    readKey(j, "maxDefaultExecutorThreads", outConfig.maxDefaultExecutorThreads);
    readKey(j, "logLevel", outConfig.logLevel);
    readKey(j, "statsFile", outConfig.statsFile);
    readKey(j, "statsInterval", outConfig.statsInterval);

    if (j.contains("logging")) {
        if (!j["logging"].is_object()) {
            throw cmdrunner::ConfigError("Invalid value for 'logging': expected an object",
                                         cmdrunner::ErrorCode::VALIDATION_INVALID_CONFIG);
        }
        applyLoggingSection(j["logging"], outConfig.logging);
    }
    if (verbose) {
        LOG_DEBUG("Config: {} top-level key(s) read", j.size());
    }
}

bool loadServiceConfig(const std::filesystem::path& configPath, ServiceConfig& outConfig,
                       bool verbose) {
    outConfig = ServiceConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& ex) {
        if (verbose) {
            LOG_ERROR("Config: failed to parse {}: {}", configPath.string(), ex.what());
        }
        return false;
    }

    if (!j.is_object()) {
        if (verbose) {
            LOG_ERROR("Config: {} must contain a JSON object", configPath.string());
        }
        return false;
    }

    applyServiceConfigJson(j, outConfig, verbose);
    if (verbose) {
        LOG_INFO("Config: loaded {}", configPath.string());
    }
    return true;
}

void validateServiceConfig(const ServiceConfig& config) {
    using cmdrunner::ConfigError;
    using cmdrunner::ErrorCode;

    if (!cmdrunner::logging::tryParseLevel(config.logLevel)) {
        throw ConfigError("Invalid log level: " + config.logLevel,
                          ErrorCode::VALIDATION_INVALID_LOG_LEVEL);
    }
    if (config.deviceDbUpdateInterval <= 0) {
        throw ConfigError("deviceDbUpdateInterval must be > 0 (got " +
                          std::to_string(config.deviceDbUpdateInterval) + ")");
    }
    if (config.readyPollInterval <= 0) {
        throw ConfigError("readyPollInterval must be > 0 (got " +
                          std::to_string(config.readyPollInterval) + ")");
    }
    if (config.exitMaxWait < 0) {
        throw ConfigError("exitMaxWait must be >= 0 (got " + std::to_string(config.exitMaxWait) +
                          ")");
    }
    if (config.maxDefaultExecutorThreads == 0 ||
        config.maxDefaultExecutorThreads > DaemonConstants::MAX_EXECUTOR_THREADS) {
        throw ConfigError("maxDefaultExecutorThreads must be in [1, " +
                          std::to_string(DaemonConstants::MAX_EXECUTOR_THREADS) + "] (got " +
                          std::to_string(config.maxDefaultExecutorThreads) + ")");
    }
    if (config.statsInterval <= 0) {
        throw ConfigError("statsInterval must be > 0 (got " +
                          std::to_string(config.statsInterval) + ")");
    }
    if (config.deviceNameFilter) {
        try {
            std::regex compiled(*config.deviceNameFilter);
            (void)compiled;
        } catch (const std::regex_error& ex) {
            throw ConfigError("Invalid deviceNameFilter '" + *config.deviceNameFilter +
                                  "': " + ex.what(),
                              ErrorCode::VALIDATION_INVALID_NAME_FILTER);
        }
    }
}

nlohmann::json serviceConfigToJson(const ServiceConfig& config) {
    nlohmann::json j;
    j["deviceDbUpdateInterval"] = config.deviceDbUpdateInterval;
    j["deviceNameFilter"] =
        config.deviceNameFilter ? nlohmann::json(*config.deviceNameFilter) : nlohmann::json();
    j["readyPollInterval"] = config.readyPollInterval;
    j["deviceFile"] = config.deviceFile;
    j["exitMaxWait"] = config.exitMaxWait;
    j["maxDefaultExecutorThreads"] = config.maxDefaultExecutorThreads;
    j["logLevel"] = config.logLevel;
    j["statsFile"] = config.statsFile;
    j["statsInterval"] = config.statsInterval;
    j["logging"] = {{"filePath", config.logging.filePath},
                    {"maxFileSize", config.logging.maxFileSize},
                    {"maxBackups", config.logging.maxBackups},
                    {"consoleOutput", config.logging.consoleOutput},
                    {"coloredOutput", config.logging.coloredOutput},
                    {"pattern", config.logging.pattern}};
    return j;
}
