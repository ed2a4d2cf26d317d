#pragma once

#include "daemon/core/cancellation.h"
#include "daemon/core/task_group.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cmdrunner {
namespace metrics {
class CounterRegistry;
}
}  // namespace cmdrunner

namespace daemon_core {

/**
 * @brief Background activity repeating a unit of work on a fixed period
 *
 * The loop runs run(), then waits one period on the cancellation token, until
 * cancelled. Exceptions from run() are recorded in lastError(), logged and
 * counted; the next iteration still fires after the normal period.
 *
 * Derived classes call markReady() once their data is usable. Readiness is
 * never revoked. Derived destructors must call stop() so the loop cannot reach
 * a partially destroyed object.
 */
class PeriodicTask {
   public:
    PeriodicTask(std::string name, std::chrono::milliseconds period);
    virtual ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Spawn the loop in group
     * @return false if already running
     */
    bool start(TaskGroup& group);

    void cancel();

    /**
     * @brief Cancel and wait for the loop to exit
     */
    void stop();

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }
    bool isReady() const {
        return ready_.load(std::memory_order_acquire);
    }

    /**
     * @brief Block until ready, logging on every idle re-check
     * @return false if the task was cancelled first
     */
    bool waitForReady();
    bool waitForReady(std::chrono::milliseconds timeout);

    const std::string& name() const {
        return name_;
    }
    std::chrono::milliseconds period() const {
        return period_;
    }

    std::optional<std::string> lastError() const;
    uint64_t iterations() const {
        return iterations_.load(std::memory_order_relaxed);
    }
    uint64_t failures() const {
        return failures_.load(std::memory_order_relaxed);
    }

    void setReadyPollInterval(std::chrono::milliseconds interval) {
        readyPollInterval_ = interval;
    }

    /**
     * @brief Count "<name>.run" and "<name>.error" into registry
     */
    void setCounters(cmdrunner::metrics::CounterRegistry* counters);

   protected:
    virtual void run(const CancellationToken& token) = 0;

    void markReady();

    /**
     * @brief Token of the running loop (never cancelled before start())
     */
    CancellationToken token() const;

    cmdrunner::metrics::CounterRegistry* counters() const {
        return counters_;
    }

   private:
    void loop(const CancellationToken& token);
    bool waitForReadyUntil(std::optional<std::chrono::steady_clock::time_point> deadline);

    std::string name_;
    std::chrono::milliseconds period_;
    std::chrono::milliseconds readyPollInterval_{1000};
    cmdrunner::metrics::CounterRegistry* counters_ = nullptr;

    mutable std::mutex mutex_;
    std::condition_variable readyCv_;
    std::shared_ptr<TaskHandle> handle_;
    std::optional<std::string> lastError_;
    bool cancelRequested_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
    std::atomic<uint64_t> iterations_{0};
    std::atomic<uint64_t> failures_{0};
};

}  // namespace daemon_core
