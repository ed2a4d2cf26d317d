#include "daemon/core/thread_pool.h"

#include "logging/logger.h"

#include <algorithm>

namespace daemon_core {

ThreadPool::ThreadPool(size_t threadCount) : state_(std::make_shared<State>()) {
    if (threadCount == 0) {
        throw cmdrunner::ConfigError("Executor thread count must be > 0");
    }
    state_->exited.assign(threadCount, false);
    workers_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, state_, i);
    }
    LOG_DEBUG("Executor started with {} worker thread(s)", threadCount);
}

ThreadPool::~ThreadPool() {
    shutdownNow();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->shutdown = true;
    }
    state_->cv.notify_all();
    joinWorkers(std::nullopt);
}

size_t ThreadPool::shutdownNow(std::optional<std::chrono::milliseconds> joinTimeout) {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->shutdown = true;
        dropped.swap(state_->queue);
    }
    state_->cv.notify_all();
    if (!dropped.empty()) {
        LOG_WARN("Executor dropping {} queued task(s)", dropped.size());
    }
    // Destroying the wrappers breaks their promises
    dropped.clear();
    return joinWorkers(joinTimeout);
}

bool ThreadPool::isShutdown() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->shutdown;
}

size_t ThreadPool::queuedTasks() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

void ThreadPool::workerLoop(std::shared_ptr<State> state, size_t index) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&state] { return state->shutdown || !state->queue.empty(); });
            if (state->queue.empty()) {
                break;
            }
            job = std::move(state->queue.front());
            state->queue.pop_front();
        }
        // packaged_task stores exceptions in the future
        job();
    }
    LOG_TRACE("Executor worker {} exiting", index);

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->exited[index] = true;
    }
    state->exitCv.notify_all();
}

size_t ThreadPool::joinWorkers(std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> joinLock(joinMutex_);

    std::vector<bool> exited;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (timeout) {
            state_->exitCv.wait_for(lock, *timeout, [this] {
                return std::all_of(state_->exited.begin(), state_->exited.end(),
                                   [](bool done) { return done; });
            });
        }
        exited = state_->exited;
    }

    size_t detached = 0;
    for (size_t i = 0; i < workers_.size(); ++i) {
        auto& worker = workers_[i];
        if (!worker.joinable() || worker.get_id() == std::this_thread::get_id()) {
            continue;
        }
        if (!timeout || exited[i]) {
            worker.join();
        } else {
            worker.detach();
            ++detached;
        }
    }
    if (detached > 0) {
        LOG_WARN("Executor detached {} worker(s) still running a job after {} ms", detached,
                 timeout->count());
    }
    return detached;
}

}  // namespace daemon_core
