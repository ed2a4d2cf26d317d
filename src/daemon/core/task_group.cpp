#include "daemon/core/task_group.h"

#include "logging/logger.h"

namespace daemon_core {

TaskHandle::TaskHandle(std::string name) : name_(std::move(name)) {}

TaskHandle::~TaskHandle() {
    cancel();
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (thread_.joinable()) {
        if (threadId_ == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void TaskHandle::launch(std::function<void(const CancellationToken&)> body) {
    CancellationToken token = source_.token();
    thread_ = std::thread([this, token, body = std::move(body)]() {
        LOG_DEBUG("Task '{}' started", name_);
        try {
            body(token);
        } catch (const cmdrunner::TaskCancelled&) {
            LOG_DEBUG("Task '{}' cancelled", name_);
        } catch (const std::exception& e) {
            LOG_ERROR("Task '{}' terminated by exception: {}", name_, e.what());
        }
        finished_.store(true, std::memory_order_release);
        LOG_DEBUG("Task '{}' finished", name_);
    });
    threadId_ = thread_.get_id();
}

void TaskHandle::cancel() {
    source_.cancel();
}

bool TaskHandle::isCancelled() const {
    return source_.isCancelled();
}

void TaskHandle::join() {
    if (threadId_ == std::this_thread::get_id()) {
        return;
    }
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

TaskGroup::~TaskGroup() {
    cancelAll();
    joinAll();
}

std::shared_ptr<TaskHandle> TaskGroup::spawn(const std::string& name, TaskBody body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw cmdrunner::ServiceError(cmdrunner::ErrorCode::TASK_GROUP_CLOSED,
                                      "Task group closed, cannot start '" + name + "'");
    }
    auto handle = std::make_shared<TaskHandle>(name);
    handle->launch(std::move(body));
    tasks_.push_back(handle);
    return handle;
}

void TaskGroup::cancelAll() {
    std::vector<std::shared_ptr<TaskHandle>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            LOG_DEBUG("Cancelling {} task(s)", tasks_.size());
        }
        closed_ = true;
        tasks = tasks_;
    }
    for (auto& task : tasks) {
        task->cancel();
    }
}

void TaskGroup::joinAll() {
    std::vector<std::shared_ptr<TaskHandle>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks = tasks_;
    }
    for (auto& task : tasks) {
        task->join();
    }
}

bool TaskGroup::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t TaskGroup::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t active = 0;
    for (const auto& task : tasks_) {
        if (!task->isFinished()) {
            ++active;
        }
    }
    return active;
}

size_t TaskGroup::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace daemon_core
