#pragma once

#include "daemon/core/cancellation.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace daemon_session {

/**
 * @brief In-flight command sessions as seen by the lifecycle controller
 */
class SessionRegistry {
   public:
    virtual ~SessionRegistry() = default;

    virtual size_t activeCount() const = 0;

    /**
     * @brief Block until no session is active, deadline passes or token is cancelled
     * @return true if drained
     */
    virtual bool waitForDrain(std::chrono::steady_clock::time_point deadline,
                              const daemon_core::CancellationToken& token) = 0;

    /**
     * @brief Stop accepting new sessions; active ones keep running
     */
    virtual void closeAdmission() = 0;

    /**
     * @brief Cancel every in-flight session
     */
    virtual void cancelAll() = 0;
};

class CommandSessionRegistry;

/**
 * @brief RAII registration of one session; closing it removes the session
 */
class SessionGuard {
   public:
    SessionGuard() = default;
    SessionGuard(CommandSessionRegistry* registry, std::string id,
                 daemon_core::CancellationToken token);
    ~SessionGuard();

    SessionGuard(SessionGuard&& other) noexcept;
    SessionGuard& operator=(SessionGuard&& other) noexcept;
    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    const std::string& id() const {
        return id_;
    }
    const daemon_core::CancellationToken& token() const {
        return token_;
    }

    void close();

   private:
    CommandSessionRegistry* registry_ = nullptr;
    std::string id_;
    daemon_core::CancellationToken token_;
};

/**
 * @brief In-process session registry
 *
 * Thread-safe. Once closeAdmission() has been called, openSession() rejects
 * new sessions with SESSION_REGISTRY_CLOSED.
 */
class CommandSessionRegistry : public SessionRegistry {
   public:
    CommandSessionRegistry() = default;

    /**
     * @throws cmdrunner::ServiceError SESSION_DUPLICATE_ID or SESSION_REGISTRY_CLOSED
     */
    SessionGuard openSession(const std::string& id);

    void closeAdmission() override;

    size_t activeCount() const override;
    bool waitForDrain(std::chrono::steady_clock::time_point deadline,
                      const daemon_core::CancellationToken& token) override;
    void cancelAll() override;

    std::vector<std::string> activeSessionIds() const;

   private:
    friend class SessionGuard;
    void release(const std::string& id);

    mutable std::mutex mutex_;
    std::condition_variable drainCv_;
    std::map<std::string, daemon_core::CancellationSource> sessions_;
    bool admissionClosed_ = false;
};

}  // namespace daemon_session
