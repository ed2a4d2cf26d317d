#ifndef DAEMON_CONSTANTS_H
#define DAEMON_CONSTANTS_H

#include <cstddef>  // for size_t

// Common constants shared across daemon components

namespace DaemonConstants {

constexpr const char* APP_NAME = "cmdrunner";

// Device directory
constexpr int DEFAULT_DEVICE_DB_UPDATE_INTERVAL_SEC = 30 * 60;
constexpr int DEFAULT_READY_POLL_INTERVAL_MS = 1000;
constexpr const char* DEFAULT_DEVICE_FILE = "devices.json";

// Shutdown
constexpr int DEFAULT_EXIT_MAX_WAIT_SEC = 300;
constexpr int HOST_LOOP_TICK_MS = 100;  // Signal polling interval of the host loop

// Offload executor
constexpr size_t DEFAULT_EXECUTOR_THREADS = 10;
constexpr size_t MAX_EXECUTOR_THREADS = 256;
constexpr int EXECUTOR_WAIT_POLL_MS = 50;  // Cancellation check while awaiting offloaded work
constexpr int EXECUTOR_STOP_TIMEOUT_MS = 2000;  // Wait for busy workers at cleanup before detaching

// Stats file
constexpr int DEFAULT_STATS_INTERVAL_SEC = 60;

}  // namespace DaemonConstants

#endif  // DAEMON_CONSTANTS_H
