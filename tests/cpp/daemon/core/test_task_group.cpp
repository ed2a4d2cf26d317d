#include "core/error_codes.h"
#include "daemon/core/cancellation.h"
#include "daemon/core/task_group.h"

#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using daemon_core::CancellationSource;
using daemon_core::CancellationToken;
using daemon_core::TaskGroup;

// ========== CancellationToken ==========

TEST(CancellationTest, DefaultTokenIsNeverCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.waitFor(1ms));
    EXPECT_NO_THROW(token.throwIfCancelled("idle"));
}

TEST(CancellationTest, CancelIsVisibleThroughAllTokens) {
    CancellationSource source;
    auto a = source.token();
    auto b = a;

    source.cancel();

    EXPECT_TRUE(source.isCancelled());
    EXPECT_TRUE(a.isCancelled());
    EXPECT_TRUE(b.isCancelled());
    EXPECT_THROW(b.throwIfCancelled("worker"), cmdrunner::TaskCancelled);
}

TEST(CancellationTest, WaitForWakesEarlyOnCancel) {
    CancellationSource source;
    auto token = source.token();

    std::thread canceller([&source]() {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.waitFor(10s));
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, 2s);
}

TEST(CancellationTest, WaitUntilTimesOutWhenNotCancelled) {
    CancellationSource source;
    auto token = source.token();
    EXPECT_FALSE(token.waitUntil(std::chrono::steady_clock::now() + 10ms));
}

// ========== TaskGroup ==========

TEST(TaskGroupTest, SpawnRunsBodyOnItsOwnThread) {
    TaskGroup group;
    std::atomic<bool> ran{false};
    auto callerId = std::this_thread::get_id();
    std::atomic<bool> otherThread{false};

    auto handle = group.spawn("one-shot", [&](const CancellationToken&) {
        otherThread = std::this_thread::get_id() != callerId;
        ran = true;
    });
    handle->join();

    EXPECT_TRUE(ran.load());
    EXPECT_TRUE(otherThread.load());
    EXPECT_TRUE(handle->isFinished());
    EXPECT_EQ(handle->name(), "one-shot");
    EXPECT_EQ(group.activeCount(), 0u);
    EXPECT_EQ(group.size(), 1u);
}

TEST(TaskGroupTest, CancelAllReachesEveryTask) {
    TaskGroup group;
    std::atomic<int> exited{0};

    for (int i = 0; i < 3; ++i) {
        group.spawn("sleeper-" + std::to_string(i), [&exited](const CancellationToken& token) {
            while (!token.waitFor(1h)) {
            }
            ++exited;
        });
    }
    EXPECT_EQ(group.activeCount(), 3u);

    group.cancelAll();
    group.joinAll();

    EXPECT_EQ(exited.load(), 3);
    EXPECT_EQ(group.activeCount(), 0u);
    EXPECT_TRUE(group.isCancelled());
}

TEST(TaskGroupTest, SpawnAfterCancelAllThrows) {
    TaskGroup group;
    group.cancelAll();

    try {
        group.spawn("late", [](const CancellationToken&) {});
        FAIL() << "expected ServiceError";
    } catch (const cmdrunner::ServiceError& e) {
        EXPECT_EQ(e.code(), cmdrunner::ErrorCode::TASK_GROUP_CLOSED);
    }
}

TEST(TaskGroupTest, CancellingOneHandleLeavesOthersRunning) {
    TaskGroup group;
    auto first = group.spawn("first", [](const CancellationToken& token) {
        while (!token.waitFor(1h)) {
        }
    });
    auto second = group.spawn("second", [](const CancellationToken& token) {
        while (!token.waitFor(1h)) {
        }
    });

    first->cancel();
    first->join();

    EXPECT_TRUE(first->isFinished());
    EXPECT_FALSE(second->isFinished());
    EXPECT_FALSE(second->isCancelled());

    group.cancelAll();
    group.joinAll();
    EXPECT_TRUE(second->isFinished());
}

TEST(TaskGroupTest, ExceptionsDoNotEscapeTheTask) {
    TaskGroup group;
    auto failing =
        group.spawn("failing", [](const CancellationToken&) { throw std::runtime_error("boom"); });
    auto cancelled = group.spawn("cancelled", [](const CancellationToken&) {
        throw cmdrunner::TaskCancelled("cancelled");
    });

    failing->join();
    cancelled->join();

    EXPECT_TRUE(failing->isFinished());
    EXPECT_TRUE(cancelled->isFinished());
}

TEST(TaskGroupTest, DestructorCancelsAndJoins) {
    std::atomic<bool> exited{false};
    {
        TaskGroup group;
        group.spawn("scoped", [&exited](const CancellationToken& token) {
            while (!token.waitFor(1h)) {
            }
            exited = true;
        });
    }
    EXPECT_TRUE(exited.load());
}

TEST(TaskGroupTest, ConcurrentJoinsAllReturn) {
    TaskGroup group;
    auto handle = group.spawn("sleeper", [](const CancellationToken& token) {
        while (!token.waitFor(1h)) {
        }
    });

    std::atomic<int> returned{0};
    std::vector<std::thread> joiners;
    for (int i = 0; i < 4; ++i) {
        joiners.emplace_back([&handle, &returned]() {
            handle->join();
            ++returned;
        });
    }
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(returned.load(), 0);

    handle->cancel();
    for (auto& joiner : joiners) {
        joiner.join();
    }
    EXPECT_EQ(returned.load(), 4);
    EXPECT_TRUE(handle->isFinished());
}

TEST(TaskGroupTest, TaskJoiningItsOwnGroupWhileOthersJoinIt) {
    TaskGroup group;
    std::promise<void> outsideJoining;
    std::shared_future<void> joining = outsideJoining.get_future().share();
    std::atomic<bool> selfJoinReturned{false};

    group.spawn("self-join", [&group, joining, &selfJoinReturned](const CancellationToken&) {
        joining.wait();
        std::this_thread::sleep_for(20ms);
        group.joinAll();
        selfJoinReturned = true;
    });

    std::thread outside([&group, &outsideJoining]() {
        outsideJoining.set_value();
        group.joinAll();
    });
    outside.join();

    EXPECT_TRUE(selfJoinReturned.load());
}
