#include "daemon/session/session_registry.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>

namespace daemon_session {

namespace {

// Granularity at which a drain wait notices cancellation of its token
constexpr std::chrono::milliseconds DRAIN_CANCEL_POLL{50};

}  // namespace

// ============================================================
// SessionGuard
// ============================================================

SessionGuard::SessionGuard(CommandSessionRegistry* registry, std::string id,
                           daemon_core::CancellationToken token)
    : registry_(registry), id_(std::move(id)), token_(std::move(token)) {}

SessionGuard::~SessionGuard() {
    close();
}

SessionGuard::SessionGuard(SessionGuard&& other) noexcept
    : registry_(other.registry_), id_(std::move(other.id_)), token_(std::move(other.token_)) {
    other.registry_ = nullptr;
}

SessionGuard& SessionGuard::operator=(SessionGuard&& other) noexcept {
    if (this != &other) {
        close();
        registry_ = other.registry_;
        id_ = std::move(other.id_);
        token_ = std::move(other.token_);
        other.registry_ = nullptr;
    }
    return *this;
}

void SessionGuard::close() {
    if (registry_) {
        registry_->release(id_);
        registry_ = nullptr;
    }
}

// ============================================================
// CommandSessionRegistry
// ============================================================

SessionGuard CommandSessionRegistry::openSession(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (admissionClosed_) {
        throw cmdrunner::ServiceError(cmdrunner::ErrorCode::SESSION_REGISTRY_CLOSED,
                                      "Not accepting new sessions: " + id);
    }
    auto [it, inserted] = sessions_.try_emplace(id);
    if (!inserted) {
        throw cmdrunner::ServiceError(cmdrunner::ErrorCode::SESSION_DUPLICATE_ID,
                                      "Session already active: " + id);
    }
    LOG_DEBUG("Session {} opened ({} active)", id, sessions_.size());
    return SessionGuard(this, id, it->second.token());
}

void CommandSessionRegistry::closeAdmission() {
    std::lock_guard<std::mutex> lock(mutex_);
    admissionClosed_ = true;
}

void CommandSessionRegistry::release(const std::string& id) {
    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(id);
        drained = sessions_.empty();
        LOG_DEBUG("Session {} closed ({} active)", id, sessions_.size());
    }
    if (drained) {
        drainCv_.notify_all();
    }
}

size_t CommandSessionRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool CommandSessionRegistry::waitForDrain(std::chrono::steady_clock::time_point deadline,
                                          const daemon_core::CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!sessions_.empty()) {
        if (token.isCancelled()) {
            return false;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                    DRAIN_CANCEL_POLL);
        drainCv_.wait_for(lock, slice);
    }
    return true;
}

void CommandSessionRegistry::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.empty()) {
        LOG_WARN("Cancelling {} active session(s)", sessions_.size());
    }
    for (auto& entry : sessions_) {
        entry.second.cancel();
    }
}

std::vector<std::string> CommandSessionRegistry::activeSessionIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

}  // namespace daemon_session
