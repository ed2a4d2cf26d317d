/**
 * @file lifecycle_controller.h
 * @brief Host loop ownership and two-phase shutdown of the service process
 *
 * State machine:
 *   Running -> GracefulDraining -> Terminating -> Stopped
 *
 * The first shutdown() closes session admission and starts a drain wait on the
 * session registry bounded by exitMaxWait; drained or not, the controller then
 * terminates. A second
 * shutdown() while draining terminates immediately. Terminating cancels every
 * task in the controller's task group, cancels in-flight sessions and stops
 * the host loop; run() then joins everything and reports Stopped.
 */

#pragma once

#include "core/config_loader.h"
#include "core/daemon_constants.h"
#include "daemon/core/cancellation.h"
#include "daemon/core/task_group.h"
#include "daemon/core/thread_pool.h"
#include "daemon/session/session_registry.h"
#include "graceful_shutdown.h"
#include "logging/metrics.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace shutdown_manager {
class ShutdownManager;
}  // namespace shutdown_manager

namespace daemon_app {

// Ordered: a controller only ever moves forward through these states
enum class LifecycleState { Running, GracefulDraining, Terminating, Stopped };

const char* lifecycleStateToString(LifecycleState state);

struct LifecycleOptions {
    bool installSignalHandlers = true;
    bool initializeLogging = true;
    // Signal counter polled by the host loop (nullptr = process-wide state)
    GracefulShutdown::SignalState* signalState = nullptr;
    // Cleanup waits this long for executor workers stuck in a call, then detaches them
    std::chrono::milliseconds executorStopTimeout{DaemonConstants::EXECUTOR_STOP_TIMEOUT_MS};
};

class LifecycleController {
   public:
    using StateObserver = std::function<void(LifecycleState)>;

    /**
     * @brief Validate configuration, install the log level and start the executor
     *
     * @throws cmdrunner::ConfigError on an unknown log level or executor size
     */
    LifecycleController(std::string appName, const ServiceConfig& config,
                        daemon_session::SessionRegistry& sessions,
                        LifecycleOptions options = LifecycleOptions{});
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    /**
     * @brief Run the host loop until terminated, then clean up
     *
     * @return process exit code
     * @throws cmdrunner::ServiceError (LIFECYCLE_STOPPED) if called more than once
     */
    int run();

    /**
     * @brief Entry point of SIGINT/SIGTERM
     *
     * First call: graceful drain. Call while draining: immediate termination.
     */
    void shutdown();

    /**
     * @brief Cancel all owned work and stop the host loop (idempotent)
     */
    void terminate();

    LifecycleState state() const;

    /**
     * @brief Wait until the controller has reached target (or a later state)
     * @return false on timeout
     */
    bool waitForState(LifecycleState target, std::chrono::milliseconds timeout) const;

    std::vector<LifecycleState> stateHistory() const;
    void setStateObserver(StateObserver observer);

    daemon_core::TaskGroup& tasks() {
        return tasks_;
    }
    daemon_core::ThreadPool& executor() {
        return *executor_;
    }
    cmdrunner::metrics::CounterRegistry& counters() {
        return counters_;
    }

    // Counter pass-through to the attached stats collector
    void registerStatsManager(std::shared_ptr<cmdrunner::metrics::CounterManager> manager);
    std::shared_ptr<cmdrunner::metrics::CounterManager> statsManager() const;
    void incrementCounter(const std::string& name, int64_t delta = 1);

    const std::string& appName() const {
        return appName_;
    }
    const ServiceConfig& config() const {
        return config_;
    }

    // Times the host has actually been terminated (0 or 1)
    uint64_t terminationCount() const {
        return terminations_.load(std::memory_order_acquire);
    }
    uint64_t drainTimeouts() const {
        return drainTimeouts_.load(std::memory_order_acquire);
    }

   private:
    void notifyObserver(LifecycleState state);
    void drainAndTerminate(std::chrono::steady_clock::time_point deadline);
    void cleanup();

    std::string appName_;
    ServiceConfig config_;
    daemon_session::SessionRegistry& sessions_;
    LifecycleOptions options_;

    cmdrunner::metrics::CounterRegistry counters_;
    std::unique_ptr<daemon_core::ThreadPool> executor_;
    std::unique_ptr<shutdown_manager::ShutdownManager> shutdownManager_;

    mutable std::mutex mutex_;
    mutable std::condition_variable stateCv_;
    std::condition_variable loopCv_;
    LifecycleState state_ = LifecycleState::Running;
    std::vector<LifecycleState> history_{LifecycleState::Running};
    bool stopRequested_ = false;
    bool ran_ = false;
    bool cleanedUp_ = false;

    std::mutex observerMutex_;
    StateObserver observer_;

    daemon_core::CancellationSource drainSource_;
    std::thread drainThread_;

    std::atomic<uint64_t> terminations_{0};
    std::atomic<uint64_t> drainTimeouts_{0};

    // Declared last: destroyed first, joining tasks before the executor goes away
    daemon_core::TaskGroup tasks_;
};

}  // namespace daemon_app
