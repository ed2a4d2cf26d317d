#pragma once

#include "graceful_shutdown.h"

#include <functional>

namespace shutdown_manager {

/**
 * @brief Bridges OS signals and service-manager notifications to the host loop
 *
 * Signal handlers only count deliveries; tick() (called from the host loop)
 * turns each delivery into one requestShutdown() call.
 */
class ShutdownManager {
   public:
    struct Dependencies {
        std::function<void()> requestShutdown;
        // Defaults to the process-wide state written by signalHandler
        GracefulShutdown::SignalState* signalState = nullptr;
    };

    explicit ShutdownManager(Dependencies deps);
    ~ShutdownManager();

    ShutdownManager(const ShutdownManager&) = delete;
    ShutdownManager& operator=(const ShutdownManager&) = delete;

    // Signal handling (SIGINT and SIGTERM only)
    void installSignalHandlers();
    void restoreSignalHandlers();

    // Notifications
    void notifyReady();
    void notifyStopping();

    // Periodic processing (called from the host loop)
    void tick();

    int signalsProcessed() const {
        return controller_.getSignalsProcessed();
    }

   private:
    void sendWatchdog();

    Dependencies deps_;
    GracefulShutdown::Controller controller_;

    bool handlersInstalled_{false};
    bool readyNotified_{false};
    bool stoppingNotified_{false};
};

}  // namespace shutdown_manager
