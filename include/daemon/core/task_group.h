#pragma once

#include "daemon/core/cancellation.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace daemon_core {

/**
 * @brief One background activity spawned by a TaskGroup
 *
 * Owns the thread running the activity and the cancellation source it observes.
 */
class TaskHandle {
   public:
    explicit TaskHandle(std::string name);
    ~TaskHandle();

    TaskHandle(const TaskHandle&) = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;

    const std::string& name() const {
        return name_;
    }

    void cancel();
    bool isCancelled() const;
    bool isFinished() const {
        return finished_.load(std::memory_order_acquire);
    }

    CancellationToken token() const {
        return source_.token();
    }

    /**
     * @brief Wait for the activity to return
     *
     * No-op when called from the activity's own thread.
     */
    void join();

   private:
    friend class TaskGroup;
    void launch(std::function<void(const CancellationToken&)> body);

    std::string name_;
    CancellationSource source_;
    std::thread thread_;
    std::thread::id threadId_;  // Written once by launch(), before the handle is shared
    std::mutex joinMutex_;
    std::atomic<bool> finished_{false};
};

/**
 * @brief Explicit collection of the background activities a host owns
 *
 * cancelAll() cancels exactly the handles spawned here and closes the group,
 * so nothing started afterwards can escape cancellation.
 */
class TaskGroup {
   public:
    using TaskBody = std::function<void(const CancellationToken&)>;

    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /**
     * @brief Start body on its own thread
     *
     * Exceptions escaping body are logged; TaskCancelled is treated as a normal exit.
     *
     * @throws cmdrunner::ServiceError (TASK_GROUP_CLOSED) after cancelAll()
     */
    std::shared_ptr<TaskHandle> spawn(const std::string& name, TaskBody body);

    void cancelAll();
    void joinAll();

    bool isCancelled() const;

    size_t activeCount() const;
    size_t size() const;

   private:
    mutable std::mutex mutex_;
    bool closed_ = false;
    std::vector<std::shared_ptr<TaskHandle>> tasks_;
};

}  // namespace daemon_core
