#pragma once

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "daemon/core/cancellation.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace daemon_core {

/**
 * @brief Fixed-size worker pool for offloading blocking calls
 *
 * shutdown() lets queued work finish; shutdownNow() drops it (the futures of
 * dropped work report std::future_error broken_promise).
 *
 * Workers share the queue state with the pool, so a worker detached by a
 * bounded shutdownNow() may outlive the pool object.
 */
class ThreadPool {
   public:
    explicit ThreadPool(size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @throws cmdrunner::ServiceError (EXECUTOR_SHUTDOWN) once shut down
     */
    template <typename F>
    auto submit(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->shutdown) {
                throw cmdrunner::ServiceError(cmdrunner::ErrorCode::EXECUTOR_SHUTDOWN,
                                              "Executor is shut down");
            }
            state_->queue.emplace_back([task]() { (*task)(); });
        }
        state_->cv.notify_one();
        return future;
    }

    void shutdown();

    /**
     * @brief Drop queued work and stop the workers
     *
     * Without a timeout, waits for every running job. With one, workers still
     * inside a job when it expires are detached and left to finish on their own.
     *
     * @return number of workers detached
     */
    size_t shutdownNow(std::optional<std::chrono::milliseconds> joinTimeout = std::nullopt);

    bool isShutdown() const;
    size_t threadCount() const {
        return workers_.size();
    }
    size_t queuedTasks() const;

   private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::condition_variable exitCv;
        std::deque<std::function<void()>> queue;
        bool shutdown = false;
        std::vector<bool> exited;  // Per worker, set as its loop returns
    };

    static void workerLoop(std::shared_ptr<State> state, size_t index);
    size_t joinWorkers(std::optional<std::chrono::milliseconds> timeout);

    std::shared_ptr<State> state_;
    std::vector<std::thread> workers_;
    std::mutex joinMutex_;
};

/**
 * @brief Block on an offloaded result while honouring cancellation
 *
 * The offloaded call keeps running to completion on its worker; only the
 * waiting side is released.
 *
 * @throws cmdrunner::TaskCancelled if token is cancelled before the result is ready
 */
template <typename T>
T waitCancellable(std::future<T>& future, const CancellationToken& token,
                  const std::string& taskName,
                  std::chrono::milliseconds poll =
                      std::chrono::milliseconds(DaemonConstants::EXECUTOR_WAIT_POLL_MS)) {
    while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        if (token.waitFor(poll)) {
            throw cmdrunner::TaskCancelled(taskName);
        }
    }
    return future.get();
}

}  // namespace daemon_core
