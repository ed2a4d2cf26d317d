#pragma once

#include "core/error_codes.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace daemon_core {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};

}  // namespace detail

/**
 * @brief Read side of a cancellation flag
 *
 * Copies share the same flag. A default-constructed token is never cancelled;
 * its waits simply sleep for the requested duration.
 */
class CancellationToken {
   public:
    CancellationToken() = default;

    bool isCancelled() const {
        if (!state_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Sleep for up to timeout, waking early on cancellation
     * @return true if cancelled
     */
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        if (!state_) {
            std::this_thread::sleep_for(timeout);
            return false;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
    }

    /**
     * @brief Sleep until deadline, waking early on cancellation
     * @return true if cancelled
     */
    template <typename Clock, typename Duration>
    bool waitUntil(std::chrono::time_point<Clock, Duration> deadline) const {
        if (!state_) {
            std::this_thread::sleep_until(deadline);
            return false;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_until(lock, deadline, [this] { return state_->cancelled; });
    }

    /**
     * @throws cmdrunner::TaskCancelled if cancelled
     */
    void throwIfCancelled(const std::string& taskName) const {
        if (isCancelled()) {
            throw cmdrunner::TaskCancelled(taskName);
        }
    }

   private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Write side of a cancellation flag
 *
 * cancel() is sticky and wakes every waiter blocked in waitFor()/waitUntil().
 */
class CancellationSource {
   public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const {
        return CancellationToken(state_);
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

   private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace daemon_core
