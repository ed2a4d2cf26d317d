#include "daemon/shutdown_manager.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <csignal>
#include <utility>

#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace shutdown_manager {

ShutdownManager::ShutdownManager(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.requestShutdown) {
        throw cmdrunner::ConfigError("ShutdownManager requires a shutdown callback");
    }
    if (!deps_.signalState) {
        deps_.signalState = &GracefulShutdown::getGlobalSignalState();
    }

    controller_.setSignalState(deps_.signalState);
    controller_.setLogCallback([](const char* message) { LOG_WARN("{}", message); });
    controller_.setShutdownCallback([this]() { deps_.requestShutdown(); });
}

ShutdownManager::~ShutdownManager() {
    restoreSignalHandlers();
}

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, GracefulShutdown::signalHandler);
    std::signal(SIGTERM, GracefulShutdown::signalHandler);
    handlersInstalled_ = true;
    LOG_DEBUG("Signal handlers installed (SIGINT, SIGTERM)");
}

void ShutdownManager::restoreSignalHandlers() {
    if (!handlersInstalled_) {
        return;
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    handlersInstalled_ = false;
}

void ShutdownManager::notifyReady() {
    if (readyNotified_) {
        return;
    }
    readyNotified_ = true;
#ifdef HAVE_SYSTEMD
    sd_notify(0, "READY=1\nSTATUS=Serving device lookups...\n");
    LOG_INFO("systemd: Notified READY=1");
#endif
}

void ShutdownManager::notifyStopping() {
    if (stoppingNotified_) {
        return;
    }
    stoppingNotified_ = true;
#ifdef HAVE_SYSTEMD
    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down...\n");
    LOG_INFO("systemd: Notified STOPPING=1");
#endif
}

void ShutdownManager::tick() {
    controller_.processPendingSignals();
    if (readyNotified_ && !stoppingNotified_) {
        sendWatchdog();
    }
}

void ShutdownManager::sendWatchdog() {
#ifdef HAVE_SYSTEMD
    sd_notify(0, "WATCHDOG=1");
#endif
}

}  // namespace shutdown_manager
