#include "daemon/core/periodic_task.h"

#include "logging/logger.h"
#include "logging/metrics.h"

#include <algorithm>

namespace daemon_core {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds period)
    : name_(std::move(name)), period_(period) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start(TaskGroup& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
        LOG_WARN("Periodic task '{}' already running", name_);
        return false;
    }
    if (handle_) {
        // Restart: reap the previous loop first
        handle_->join();
    }
    cancelRequested_ = false;
    running_.store(true, std::memory_order_release);
    try {
        handle_ = group.spawn(name_, [this](const CancellationToken& token) { loop(token); });
    } catch (...) {
        running_.store(false, std::memory_order_release);
        throw;
    }
    LOG_INFO("Periodic task '{}' started (period {} ms)", name_, period_.count());
    return true;
}

void PeriodicTask::cancel() {
    std::shared_ptr<TaskHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelRequested_ = true;
        handle = handle_;
    }
    if (handle) {
        handle->cancel();
    }
    readyCv_.notify_all();
}

void PeriodicTask::stop() {
    cancel();
    std::shared_ptr<TaskHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = handle_;
    }
    if (handle) {
        handle->join();
    }
}

bool PeriodicTask::waitForReady() {
    return waitForReadyUntil(std::nullopt);
}

bool PeriodicTask::waitForReady(std::chrono::milliseconds timeout) {
    return waitForReadyUntil(std::chrono::steady_clock::now() + timeout);
}

bool PeriodicTask::waitForReadyUntil(
    std::optional<std::chrono::steady_clock::time_point> deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!ready_.load(std::memory_order_acquire)) {
        if (cancelRequested_ || (handle_ && handle_->isCancelled())) {
            LOG_DEBUG("Periodic task '{}' cancelled before ready", name_);
            return false;
        }
        auto wait = readyPollInterval_;
        if (deadline) {
            auto now = std::chrono::steady_clock::now();
            if (now >= *deadline) {
                return false;
            }
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(
                                      *deadline - now));
        }
        LOG_INFO("Waiting for data ({})", name_);
        readyCv_.wait_for(lock, wait);
    }
    return true;
}

std::optional<std::string> PeriodicTask::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void PeriodicTask::setCounters(cmdrunner::metrics::CounterRegistry* counters) {
    counters_ = counters;
    if (counters_) {
        counters_->declare({name_ + ".run", name_ + ".error"});
    }
}

void PeriodicTask::markReady() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ready_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
    }
    LOG_INFO("Periodic task '{}' is ready", name_);
    readyCv_.notify_all();
}

CancellationToken PeriodicTask::token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ ? handle_->token() : CancellationToken();
}

void PeriodicTask::loop(const CancellationToken& token) {
    while (!token.isCancelled()) {
        iterations_.fetch_add(1, std::memory_order_relaxed);
        try {
            run(token);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lastError_.reset();
            }
            if (counters_) {
                counters_->increment(name_ + ".run");
            }
        } catch (const cmdrunner::TaskCancelled&) {
            break;
        } catch (const std::exception& e) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lastError_ = e.what();
            }
            if (counters_) {
                counters_->increment(name_ + ".error");
            }
            LOG_ERROR("Periodic task '{}' failed: {}", name_, e.what());
        }

        if (token.waitFor(period_)) {
            break;
        }
    }

    running_.store(false, std::memory_order_release);
    readyCv_.notify_all();
    LOG_INFO("Periodic task '{}' stopped", name_);
}

}  // namespace daemon_core
