#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace GracefulShutdown {

// ========== Signal State ==========
// Written by the signal handler, drained by the host loop. Every delivery of
// SIGINT/SIGTERM is counted so a repeated signal can escalate the shutdown.

struct SignalState {
    std::atomic<int> pending{0};         // Undelivered SIGINT/SIGTERM count
    volatile sig_atomic_t received = 0;  // Last signal number (for logging)

    static_assert(std::atomic<int>::is_always_lock_free,
                  "signal handler needs a lock-free counter");

    void reset() {
        pending.store(0);
        received = 0;
    }
};

// ========== Shutdown Controller ==========
// Turns pending signals into shutdown requests outside signal context.
// Testable without actual signal delivery.

class Controller {
   public:
    using ShutdownCallback = std::function<void()>;
    using LogCallback = std::function<void(const char*)>;

    Controller() = default;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }

    void setShutdownCallback(ShutdownCallback cb) {
        shutdownCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Invoke the shutdown callback once per pending signal.
    // Returns true if any signal was processed.
    bool processPendingSignals();

    int getLastSignal() const {
        return lastSignal_;
    }

    // Signals handled since construction
    int getSignalsProcessed() const {
        return signalsProcessed_;
    }

    enum class Action { NONE, SHUTDOWN };
    Action getLastAction() const {
        return lastAction_;
    }

   private:
    SignalState* signalState_ = nullptr;

    ShutdownCallback shutdownCallback_;
    LogCallback logCallback_;

    int lastSignal_ = 0;
    int signalsProcessed_ = 0;
    Action lastAction_ = Action::NONE;
};

// ========== Signal Handler ==========
// Async-signal-safe: only touches SignalState.
void signalHandler(int sig);

SignalState& getGlobalSignalState();

}  // namespace GracefulShutdown
