#include "graceful_shutdown.h"

#include <cstdio>

namespace GracefulShutdown {

// Global signal state (used by signalHandler)
static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

// Async-signal-safe signal handler - ONLY sets flags
void signalHandler(int sig) {
    if (sig != SIGINT && sig != SIGTERM) {
        return;
    }
    g_signalState.received = sig;
    g_signalState.pending.fetch_add(1, std::memory_order_relaxed);
}

bool Controller::processPendingSignals() {
    if (!signalState_) {
        return false;
    }

    lastAction_ = Action::NONE;

    int pending = signalState_->pending.exchange(0, std::memory_order_acq_rel);
    if (pending <= 0) {
        return false;
    }

    lastSignal_ = signalState_->received;
    lastAction_ = Action::SHUTDOWN;

    for (int i = 0; i < pending; ++i) {
        ++signalsProcessed_;
        if (logCallback_) {
            char buf[80];
            snprintf(buf, sizeof(buf), "Received signal %d (#%d), requesting shutdown",
                     lastSignal_, signalsProcessed_);
            logCallback_(buf);
        }
        if (shutdownCallback_) {
            shutdownCallback_();
        }
    }
    return true;
}

}  // namespace GracefulShutdown
