/**
 * @file lifecycle_controller.cpp
 * @brief Implementation of the service lifecycle controller
 */

#include "daemon/app/lifecycle_controller.h"

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "daemon/shutdown_manager.h"
#include "logging/logger.h"

namespace daemon_app {

namespace {

constexpr const char* COUNTER_SHUTDOWN = "lifecycle.shutdown";
constexpr const char* COUNTER_ESCALATED = "lifecycle.shutdown.escalated";
constexpr const char* COUNTER_TERMINATE = "lifecycle.terminate";
constexpr const char* COUNTER_DRAIN_TIMEOUT = "lifecycle.drain_timeout";

}  // namespace

const char* lifecycleStateToString(LifecycleState state) {
    switch (state) {
    case LifecycleState::Running:
        return "running";
    case LifecycleState::GracefulDraining:
        return "graceful_draining";
    case LifecycleState::Terminating:
        return "terminating";
    case LifecycleState::Stopped:
        return "stopped";
    }
    return "unknown";
}

LifecycleController::LifecycleController(std::string appName, const ServiceConfig& config,
                                         daemon_session::SessionRegistry& sessions,
                                         LifecycleOptions options)
    : appName_(std::move(appName)), config_(config), sessions_(sessions), options_(options) {
    auto level = cmdrunner::logging::tryParseLevel(config_.logLevel);
    if (!level) {
        throw cmdrunner::ConfigError("Invalid log level: " + config_.logLevel,
                                     cmdrunner::ErrorCode::VALIDATION_INVALID_LOG_LEVEL);
    }
    if (options_.initializeLogging) {
        auto logConfig = config_.logging;
        logConfig.level = *level;
        if (!cmdrunner::logging::initialize(logConfig)) {
            throw cmdrunner::ConfigError("Logger initialization failed");
        }
    }
    cmdrunner::logging::setLevel(*level);

    if (config_.maxDefaultExecutorThreads == 0 ||
        config_.maxDefaultExecutorThreads > DaemonConstants::MAX_EXECUTOR_THREADS) {
        throw cmdrunner::ConfigError("maxDefaultExecutorThreads out of range: " +
                                     std::to_string(config_.maxDefaultExecutorThreads));
    }
    executor_ = std::make_unique<daemon_core::ThreadPool>(config_.maxDefaultExecutorThreads);

    shutdown_manager::ShutdownManager::Dependencies deps;
    deps.requestShutdown = [this]() { shutdown(); };
    deps.signalState = options_.signalState;
    shutdownManager_ = std::make_unique<shutdown_manager::ShutdownManager>(std::move(deps));

    counters_.declare({COUNTER_SHUTDOWN, COUNTER_ESCALATED, COUNTER_TERMINATE,
                       COUNTER_DRAIN_TIMEOUT});

    LOG_INFO("{}: executor with {} thread(s), exit max wait {} s", appName_,
             config_.maxDefaultExecutorThreads, config_.exitMaxWait);
}

LifecycleController::~LifecycleController() {
    terminate();
    cleanup();
}

int LifecycleController::run() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ran_ || state_ == LifecycleState::Stopped) {
            throw cmdrunner::ServiceError(cmdrunner::ErrorCode::LIFECYCLE_STOPPED,
                                          appName_ + " has already run");
        }
        ran_ = true;
    }

    if (options_.installSignalHandlers) {
        shutdownManager_->installSignalHandlers();
    }
    shutdownManager_->notifyReady();
    LOG_INFO("{} running. Send SIGINT or SIGTERM to stop.", appName_);

    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopRequested_) {
            loopCv_.wait_for(lock, std::chrono::milliseconds(DaemonConstants::HOST_LOOP_TICK_MS));
            lock.unlock();
            shutdownManager_->tick();
            lock.lock();
        }
    }

    cleanup();
    LOG_INFO("{} stopped", appName_);
    return 0;
}

void LifecycleController::shutdown() {
    enum class Action { Drain, Escalate, Ignore };
    Action action = Action::Ignore;
    LifecycleState current = LifecycleState::Running;
    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = state_;
        if (state_ == LifecycleState::Running) {
            state_ = LifecycleState::GracefulDraining;
            history_.push_back(state_);
            stateCv_.notify_all();
            deadline = std::chrono::steady_clock::now() + config_.exitMaxWaitDuration();
            action = Action::Drain;
        } else if (state_ == LifecycleState::GracefulDraining) {
            action = Action::Escalate;
        }
    }

    switch (action) {
    case Action::Drain: {
        sessions_.closeAdmission();
        counters_.increment(COUNTER_SHUTDOWN);
        LOG_INFO("Shutting down: waiting up to {} s for {} active session(s)", config_.exitMaxWait,
                 sessions_.activeCount());
        notifyObserver(LifecycleState::GracefulDraining);

        // Observers see GracefulDraining before the drain thread can report Terminating
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cleanedUp_) {
            drainThread_ = std::thread(&LifecycleController::drainAndTerminate, this, deadline);
        }
        break;
    }
    case Action::Escalate:
        counters_.increment(COUNTER_ESCALATED);
        LOG_WARN("Shutdown requested again while draining, terminating now");
        terminate();
        break;
    case Action::Ignore:
        LOG_DEBUG("Shutdown requested while {}, ignoring", lifecycleStateToString(current));
        break;
    }
}

void LifecycleController::terminate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == LifecycleState::Terminating || state_ == LifecycleState::Stopped) {
            return;
        }
        state_ = LifecycleState::Terminating;
        history_.push_back(state_);
        stateCv_.notify_all();
    }
    notifyObserver(LifecycleState::Terminating);

    terminations_.fetch_add(1, std::memory_order_acq_rel);
    counters_.increment(COUNTER_TERMINATE);
    LOG_WARN("Terminating: cancelling {} task(s) and {} session(s)", tasks_.activeCount(),
             sessions_.activeCount());

    drainSource_.cancel();
    sessions_.cancelAll();
    tasks_.cancelAll();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    loopCv_.notify_all();
}

void LifecycleController::drainAndTerminate(std::chrono::steady_clock::time_point deadline) {
    bool drained = sessions_.waitForDrain(deadline, drainSource_.token());
    if (drained) {
        LOG_INFO("All sessions finished");
    } else if (drainSource_.isCancelled()) {
        LOG_DEBUG("Session drain interrupted");
    } else {
        drainTimeouts_.fetch_add(1, std::memory_order_acq_rel);
        counters_.increment(COUNTER_DRAIN_TIMEOUT);
        LOG_ERROR("Timeout waiting for sessions, forced termination ({} still active) [{}]",
                  sessions_.activeCount(),
                  cmdrunner::errorCodeToString(cmdrunner::ErrorCode::SHUTDOWN_DRAIN_TIMEOUT));
    }
    terminate();
}

void LifecycleController::cleanup() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cleanedUp_) {
            return;
        }
        cleanedUp_ = true;
    }

    shutdownManager_->notifyStopping();

    LOG_INFO("  Step 1: Stopping background tasks...");
    tasks_.cancelAll();
    tasks_.joinAll();

    std::thread drainThread;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drainThread = std::move(drainThread_);
    }
    if (drainThread.joinable()) {
        drainThread.join();
    }

    LOG_INFO("  Step 2: Stopping executor...");
    size_t detached = executor_->shutdownNow(options_.executorStopTimeout);
    if (detached > 0) {
        LOG_WARN("  {} executor call(s) ignored cancellation, not waiting for them", detached);
    }
    shutdownManager_->restoreSignalHandlers();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = LifecycleState::Stopped;
        history_.push_back(state_);
        stateCv_.notify_all();
    }
    notifyObserver(LifecycleState::Stopped);
    cmdrunner::logging::flush();
}

LifecycleState LifecycleController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool LifecycleController::waitForState(LifecycleState target,
                                       std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return stateCv_.wait_for(lock, timeout, [this, target] {
        return static_cast<int>(state_) >= static_cast<int>(target);
    });
}

std::vector<LifecycleState> LifecycleController::stateHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

void LifecycleController::setStateObserver(StateObserver observer) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    observer_ = std::move(observer);
}

void LifecycleController::notifyObserver(LifecycleState state) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    if (observer_) {
        observer_(state);
    }
}

void LifecycleController::registerStatsManager(
    std::shared_ptr<cmdrunner::metrics::CounterManager> manager) {
    counters_.attach(std::move(manager));
}

std::shared_ptr<cmdrunner::metrics::CounterManager> LifecycleController::statsManager() const {
    return counters_.manager();
}

void LifecycleController::incrementCounter(const std::string& name, int64_t delta) {
    counters_.increment(name, delta);
}

}  // namespace daemon_app
