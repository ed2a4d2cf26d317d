#include "core/config_loader.h"
#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "daemon/app/lifecycle_controller.h"
#include "daemon/metrics/stats_reporter.h"
#include "daemon/session/session_registry.h"
#include "device_db/device_db.h"
#include "device_db/json_file_backend.h"
#include "logging/logger.h"
#include "logging/metrics.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

void printUsage(const char* programName) {
    std::cout << "Device directory command runner daemon" << std::endl;
    std::cout << "Usage: " << programName << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>       Configuration file (default: " << DEFAULT_CONFIG_FILE
              << ")" << std::endl;
    std::cout << "  --device-file <path>  Device inventory JSON (default: "
              << DaemonConstants::DEFAULT_DEVICE_FILE << ")" << std::endl;
    std::cout << "  --stats-file <path>   Write counter snapshots to this file" << std::endl;
    std::cout << "  --log-level <level>   trace|debug|info|warn|error|critical|off" << std::endl;
    std::cout << "  --help                Show this help message" << std::endl;
}

struct CommandLine {
    std::string configPath = DEFAULT_CONFIG_FILE;
    bool configGiven = false;
    std::optional<std::string> deviceFile;
    std::optional<std::string> statsFile;
    std::optional<std::string> logLevel;
};

enum class ParseResult { Ok, Help, Error };

ParseResult parseArguments(int argc, char* argv[], CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return ParseResult::Help;
        } else if (arg == "--config" && i + 1 < argc) {
            cli.configPath = argv[++i];
            cli.configGiven = true;
        } else if (arg == "--device-file" && i + 1 < argc) {
            cli.deviceFile = argv[++i];
        } else if (arg == "--stats-file" && i + 1 < argc) {
            cli.statsFile = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.logLevel = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return ParseResult::Error;
        }
    }
    return ParseResult::Ok;
}

void applyOverrides(const CommandLine& cli, ServiceConfig& config) {
    if (cli.deviceFile) {
        config.deviceFile = *cli.deviceFile;
        LOG_INFO("Config: CLI device file override: {}", config.deviceFile);
    }
    if (cli.statsFile) {
        config.statsFile = *cli.statsFile;
        LOG_INFO("Config: CLI stats file override: {}", config.statsFile);
    }
    if (cli.logLevel) {
        config.logLevel = *cli.logLevel;
        LOG_INFO("Config: CLI log level override: {}", config.logLevel);
    }
}

int runService(const ServiceConfig& config) {
    daemon_session::CommandSessionRegistry sessions;
    daemon_app::LifecycleController controller(DaemonConstants::APP_NAME, config, sessions);
    controller.registerStatsManager(std::make_shared<cmdrunner::metrics::LocalCounterManager>());

    LOG_INFO("========================================");
    LOG_INFO("  {} - device directory service", DaemonConstants::APP_NAME);
    LOG_INFO("========================================");
    LOG_INFO("PID: {}", getpid());

    device_db::DeviceDbOptions dbOptions;
    dbOptions.updateInterval = config.deviceDbUpdatePeriod();
    dbOptions.nameFilter = config.deviceNameFilter;
    dbOptions.readyPollInterval = std::chrono::milliseconds(config.readyPollInterval);

    auto backend = std::make_shared<device_db::JsonFileBackend>(config.deviceFile);
    device_db::DeviceDb deviceDb(backend, dbOptions, &controller.executor(),
                                 &controller.counters());

    std::unique_ptr<daemon_metrics::StatsReporter> stats;
    if (!config.statsFile.empty()) {
        stats = std::make_unique<daemon_metrics::StatsReporter>(
            config.statsFile, std::chrono::seconds(config.statsInterval), controller.counters(),
            DaemonConstants::APP_NAME);
        stats->setExtraProvider([&deviceDb, &sessions, &controller]() {
            return nlohmann::json{
                {"state", daemon_app::lifecycleStateToString(controller.state())},
                {"deviceEntries", deviceDb.size()},
                {"deviceDataValid", deviceDb.isDataValid()},
                {"activeSessions", sessions.activeCount()},
            };
        });
        stats->setCounters(&controller.counters());
        stats->start(controller.tasks());
        LOG_INFO("Stats file: {} (every {} s)", config.statsFile, config.statsInterval);
    }

    LOG_INFO("Device file: {} (refresh every {} s)", config.deviceFile,
             config.deviceDbUpdateInterval);
    deviceDb.start(controller.tasks());
    controller.tasks().spawn("startup", [&deviceDb](const daemon_core::CancellationToken&) {
        if (deviceDb.waitForData()) {
            LOG_INFO("Device directory ready ({} entries)", deviceDb.size());
        }
    });

    int exitCode = controller.run();
    if (stats) {
        stats->removeIfExists();
    }
    return exitCode;
}

}  // namespace

int main(int argc, char* argv[]) {
    // stderr-only logging until the configuration is known
    cmdrunner::logging::initializeEarly();

    CommandLine cli;
    switch (parseArguments(argc, argv, cli)) {
    case ParseResult::Help:
        printUsage(argv[0]);
        return 0;
    case ParseResult::Error:
        printUsage(argv[0]);
        return 1;
    case ParseResult::Ok:
        break;
    }

    ServiceConfig config;
    int exitCode = 0;
    try {
        if (!loadServiceConfig(cli.configPath, config) && cli.configGiven) {
            throw cmdrunner::ConfigError("Cannot load configuration file " + cli.configPath,
                                         cmdrunner::ErrorCode::VALIDATION_FILE_NOT_FOUND);
        }
        applyOverrides(cli, config);
        validateServiceConfig(config);
        exitCode = runService(config);
    } catch (const cmdrunner::ConfigError& e) {
        LOG_CRITICAL("Configuration error: {} [{} {}]", e.what(),
                     cmdrunner::errorCodeToString(e.code()),
                     cmdrunner::errorCodeToHex(e.code()));
        exitCode = 2;
    } catch (const cmdrunner::ServiceError& e) {
        LOG_CRITICAL("Fatal: {} [{} {}]", e.what(), cmdrunner::errorCodeToString(e.code()),
                     cmdrunner::errorCodeToHex(e.code()));
        exitCode = 1;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal: {}", e.what());
        exitCode = 1;
    }

    LOG_INFO("Goodbye!");
    cmdrunner::logging::shutdown();
    return exitCode;
}
