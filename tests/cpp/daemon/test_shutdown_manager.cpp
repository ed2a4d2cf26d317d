#include "core/error_codes.h"
#include "daemon/shutdown_manager.h"

#include <csignal>
#include <gtest/gtest.h>

TEST(ShutdownManagerTest, RequiresShutdownCallback) {
    shutdown_manager::ShutdownManager::Dependencies deps;
    EXPECT_THROW(shutdown_manager::ShutdownManager manager(deps), cmdrunner::ConfigError);
}

TEST(ShutdownManagerTest, TickRoutesEachPendingSignalToCallback) {
    GracefulShutdown::SignalState state;
    int calls = 0;

    shutdown_manager::ShutdownManager::Dependencies deps;
    deps.requestShutdown = [&calls]() { ++calls; };
    deps.signalState = &state;
    shutdown_manager::ShutdownManager manager(deps);

    manager.tick();
    EXPECT_EQ(calls, 0);

    state.pending = 1;
    state.received = SIGTERM;
    manager.tick();
    EXPECT_EQ(calls, 1);

    state.pending = 1;
    state.received = SIGINT;
    manager.tick();
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(manager.signalsProcessed(), 2);
}

TEST(ShutdownManagerTest, InstalledHandlerFeedsGlobalState) {
    auto& global = GracefulShutdown::getGlobalSignalState();
    global.reset();
    int calls = 0;

    shutdown_manager::ShutdownManager::Dependencies deps;
    deps.requestShutdown = [&calls]() { ++calls; };
    shutdown_manager::ShutdownManager manager(deps);
    manager.installSignalHandlers();

    std::raise(SIGTERM);
    manager.tick();
    EXPECT_EQ(calls, 1);

    manager.restoreSignalHandlers();
    global.reset();
}

TEST(ShutdownManagerTest, NotificationsAreIdempotent) {
    GracefulShutdown::SignalState state;
    shutdown_manager::ShutdownManager::Dependencies deps;
    deps.requestShutdown = []() {};
    deps.signalState = &state;
    shutdown_manager::ShutdownManager manager(deps);

    manager.notifyReady();
    manager.notifyReady();
    manager.tick();
    manager.notifyStopping();
    manager.notifyStopping();
    manager.tick();
    SUCCEED();
}
