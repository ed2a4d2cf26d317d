#include "core/error_codes.h"
#include "daemon/core/thread_pool.h"
#include "device_db/device_db.h"
#include "logging/metrics.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using device_db::Device;
using device_db::DeviceDb;
using device_db::DeviceDbOptions;
using device_db::FetchRequest;

namespace {

Device makeDevice(const std::string& hostname, std::optional<std::string> alias = std::nullopt,
                  const std::string& vendor = "arista") {
    Device device;
    device.hostname = hostname;
    device.alias = std::move(alias);
    device.vendor = vendor;
    return device;
}

// Backend answering from an in-memory inventory, recording every request
class FakeBackend : public device_db::DeviceBackend {
   public:
    using Responder = std::function<std::vector<Device>(const FetchRequest&)>;

    std::vector<Device> fetchDevices(const FetchRequest& request,
                                     const daemon_core::CancellationToken&) override {
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            threads_.push_back(std::this_thread::get_id());
            responder = responder_;
        }
        if (responder) {
            return responder(request);
        }
        return select(request);
    }

    void setInventory(std::vector<Device> devices) {
        std::lock_guard<std::mutex> lock(mutex_);
        inventory_ = std::move(devices);
    }

    void setResponder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    FetchRequest lastRequest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.back();
    }

    std::thread::id lastThread() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return threads_.back();
    }

   private:
    std::vector<Device> select(const FetchRequest& request) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Device> result;
        for (const auto& device : inventory_) {
            if (request.hostname && !device.answersTo(*request.hostname)) {
                continue;
            }
            if (request.nameFilter && !request.nameFilter->matches(device.hostname)) {
                continue;
            }
            result.push_back(device);
        }
        return result;
    }

    mutable std::mutex mutex_;
    std::vector<Device> inventory_;
    std::vector<FetchRequest> requests_;
    std::vector<std::thread::id> threads_;
    Responder responder_;
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

class DeviceDbTest : public ::testing::Test {
   protected:
    void SetUp() override {
        backend_ = std::make_shared<FakeBackend>();
        backend_->setInventory({makeDevice("rsw001.p001.f01.ath1", "rsw1"),
                                makeDevice("rsw002.p001.f01.ath1"),
                                makeDevice("fsw001.p001.f01.ath1", "fsw1", "juniper")});
        options_.updateInterval = 1h;
        options_.readyPollInterval = 10ms;
    }

    std::unique_ptr<DeviceDb> makeDb(daemon_core::ThreadPool* executor = nullptr,
                                     cmdrunner::metrics::CounterRegistry* counters = nullptr) {
        return std::make_unique<DeviceDb>(backend_, options_, executor, counters);
    }

    std::shared_ptr<FakeBackend> backend_;
    DeviceDbOptions options_;
    daemon_core::TaskGroup group_;
};

}  // namespace

TEST_F(DeviceDbTest, NullBackendRejected) {
    EXPECT_THROW(DeviceDb(nullptr, options_), cmdrunner::ConfigError);
}

TEST_F(DeviceDbTest, InvalidNameFilterRejected) {
    options_.nameFilter = "rsw(";
    try {
        makeDb();
        FAIL() << "expected ConfigError";
    } catch (const cmdrunner::ConfigError& e) {
        EXPECT_EQ(e.code(), cmdrunner::ErrorCode::VALIDATION_INVALID_NAME_FILTER);
    }
}

TEST_F(DeviceDbTest, NotReadyBeforeFirstRefresh) {
    auto db = makeDb();
    EXPECT_FALSE(db->isDataValid());
    EXPECT_EQ(db->size(), 0u);
    EXPECT_EQ(db->find("rsw1"), nullptr);
}

TEST_F(DeviceDbTest, RefreshIndexesHostnamesAndAliases) {
    auto db = makeDb();
    db->start(group_);
    ASSERT_TRUE(db->waitForData());
    EXPECT_TRUE(db->isDataValid());

    // 3 hostnames + 2 aliases
    EXPECT_EQ(db->size(), 5u);

    auto byHostname = db->get("rsw001.p001.f01.ath1");
    auto byAlias = db->get("rsw1");
    ASSERT_NE(byHostname, nullptr);
    EXPECT_EQ(byHostname, byAlias);
    EXPECT_EQ(byAlias->hostname, "rsw001.p001.f01.ath1");
    EXPECT_EQ(db->get("fsw1")->vendor, "juniper");
}

TEST_F(DeviceDbTest, BulkRefreshUsesNameFilter) {
    options_.nameFilter = "^rsw";
    auto db = makeDb();
    ASSERT_TRUE(db->nameFilter().has_value());
    db->start(group_);
    ASSERT_TRUE(db->waitForData());

    auto request = backend_->lastRequest();
    ASSERT_TRUE(request.nameFilter.has_value());
    EXPECT_EQ(request.nameFilter->pattern(), "^rsw");
    EXPECT_FALSE(request.hostname.has_value());

    EXPECT_NE(db->find("rsw1"), nullptr);
    EXPECT_EQ(db->find("fsw1"), nullptr);
}

TEST_F(DeviceDbTest, CacheHitDoesNotCallBackend) {
    auto db = makeDb();
    db->start(group_);
    ASSERT_TRUE(db->waitForData());
    size_t calls = backend_->calls();

    db->get("rsw1");
    db->get("rsw002.p001.f01.ath1");
    EXPECT_EQ(backend_->calls(), calls);
}

TEST_F(DeviceDbTest, MissWithoutAutofetchThrowsWithoutBackendCall) {
    auto db = makeDb();
    try {
        db->get("rsw1", false);
        FAIL() << "expected DeviceNotFoundError";
    } catch (const cmdrunner::DeviceNotFoundError& e) {
        EXPECT_EQ(e.code(), cmdrunner::ErrorCode::DEVICE_NOT_FOUND);
        EXPECT_EQ(e.deviceName(), "rsw1");
    }
    EXPECT_EQ(backend_->calls(), 0u);
}

TEST_F(DeviceDbTest, MissFetchesSingleDeviceAndMerges) {
    auto db = makeDb();

    auto device = db->get("rsw1");
    ASSERT_NE(device, nullptr);
    EXPECT_EQ(device->hostname, "rsw001.p001.f01.ath1");
    EXPECT_EQ(backend_->calls(), 1u);

    auto request = backend_->lastRequest();
    ASSERT_TRUE(request.hostname.has_value());
    EXPECT_EQ(*request.hostname, "rsw1");
    EXPECT_FALSE(request.nameFilter.has_value());

    // Merged under both names; no further backend traffic
    EXPECT_EQ(db->get("rsw001.p001.f01.ath1"), device);
    EXPECT_EQ(backend_->calls(), 1u);

    // A point fetch does not make the bulk data valid
    EXPECT_FALSE(db->isDataValid());
}

TEST_F(DeviceDbTest, UnknownDeviceAfterFetchThrows) {
    auto db = makeDb();
    EXPECT_THROW(db->get("does-not-exist"), cmdrunner::DeviceNotFoundError);
    EXPECT_EQ(backend_->calls(), 1u);
    EXPECT_EQ(db->size(), 0u);
}

TEST_F(DeviceDbTest, SingleResultIndexedUnderRequestedName) {
    backend_->setResponder([](const FetchRequest&) {
        return std::vector<Device>{makeDevice("rsw001.p001.f01.ath1", "rsw1")};
    });
    auto db = makeDb();

    auto device = db->get("RSW001");
    ASSERT_NE(device, nullptr);
    EXPECT_EQ(device->hostname, "rsw001.p001.f01.ath1");
    EXPECT_EQ(db->find("RSW001"), device);
    EXPECT_EQ(db->find("rsw1"), device);
}

TEST_F(DeviceDbTest, AmbiguousResultNotIndexedUnderRequestedName) {
    backend_->setResponder([](const FetchRequest&) {
        return std::vector<Device>{makeDevice("rsw001.p001.f01.ath1"),
                                   makeDevice("rsw002.p001.f01.ath1")};
    });
    auto db = makeDb();

    EXPECT_THROW(db->get("rsw00"), cmdrunner::DeviceNotFoundError);
    // Both results were still merged
    EXPECT_NE(db->find("rsw001.p001.f01.ath1"), nullptr);
    EXPECT_NE(db->find("rsw002.p001.f01.ath1"), nullptr);
}

TEST_F(DeviceDbTest, BackendFailureOnPointFetchIsBackendError) {
    backend_->setResponder(
        [](const FetchRequest&) -> std::vector<Device> { throw std::runtime_error("timeout"); });
    auto db = makeDb();

    try {
        db->get("rsw1");
        FAIL() << "expected BackendError";
    } catch (const cmdrunner::BackendError& e) {
        EXPECT_EQ(e.code(), cmdrunner::ErrorCode::DEVICE_BACKEND_FAILED);
        EXPECT_NE(std::string(e.what()).find("timeout"), std::string::npos);
    }
}

TEST_F(DeviceDbTest, ServiceErrorsFromBackendPassThrough) {
    backend_->setResponder([](const FetchRequest&) -> std::vector<Device> {
        throw cmdrunner::BackendError("bad record",
                                      cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
    });
    auto db = makeDb();

    try {
        db->get("rsw1");
        FAIL() << "expected BackendError";
    } catch (const cmdrunner::BackendError& e) {
        EXPECT_EQ(e.code(), cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
    }
}

TEST_F(DeviceDbTest, FailedRefreshIsRetriedOnNextPeriod) {
    options_.updateInterval = 10ms;
    std::atomic<int> attempts{0};
    backend_->setResponder([&attempts](const FetchRequest&) {
        if (attempts.fetch_add(1) == 0) {
            throw std::runtime_error("directory unavailable");
        }
        return std::vector<Device>{makeDevice("rsw001.p001.f01.ath1", "rsw1")};
    });
    auto db = makeDb();
    db->start(group_);

    ASSERT_TRUE(db->waitForData());
    EXPECT_GE(attempts.load(), 2);
    EXPECT_EQ(db->failures(), 1u);
    EXPECT_NE(db->find("rsw1"), nullptr);
}

TEST_F(DeviceDbTest, ReadinessSurvivesLaterFailures) {
    options_.updateInterval = 5ms;
    std::atomic<int> attempts{0};
    backend_->setResponder([&attempts](const FetchRequest&) {
        if (attempts.fetch_add(1) > 0) {
            throw std::runtime_error("directory unavailable");
        }
        return std::vector<Device>{makeDevice("rsw001.p001.f01.ath1", "rsw1")};
    });
    auto db = makeDb();
    db->start(group_);

    ASSERT_TRUE(db->waitForData());
    ASSERT_TRUE(eventually([&] { return db->failures() >= 3; }));
    EXPECT_TRUE(db->isDataValid());
    EXPECT_NE(db->get("rsw1", false), nullptr);
}

TEST_F(DeviceDbTest, RefreshReplacesEntriesWithoutEviction) {
    auto db = makeDb();
    auto before = db->get("rsw1");
    ASSERT_EQ(before->vendor, "arista");
    ASSERT_NE(db->get("rsw002.p001.f01.ath1"), nullptr);

    backend_->setInventory({makeDevice("rsw001.p001.f01.ath1", "rsw1", "cisco")});
    db->start(group_);
    ASSERT_TRUE(db->waitForData());

    auto after = db->get("rsw1");
    EXPECT_EQ(after->vendor, "cisco");
    EXPECT_EQ(before->vendor, "arista");

    // Devices absent from the latest refresh stay cached
    EXPECT_NE(db->find("rsw002.p001.f01.ath1"), nullptr);
    EXPECT_EQ(db->size(), 3u);
}

TEST_F(DeviceDbTest, RecordsWithoutHostnameSkipped) {
    backend_->setInventory({makeDevice(""), makeDevice("rsw002.p001.f01.ath1")});
    auto db = makeDb();
    db->start(group_);
    ASSERT_TRUE(db->waitForData());

    EXPECT_EQ(db->size(), 1u);
    EXPECT_EQ(db->find(""), nullptr);
}

TEST_F(DeviceDbTest, ExecutorRunsBackendOffCallerThread) {
    daemon_core::ThreadPool pool(2);
    auto db = makeDb(&pool);

    auto device = db->get("fsw1");
    ASSERT_NE(device, nullptr);
    EXPECT_NE(backend_->lastThread(), std::this_thread::get_id());
}

TEST_F(DeviceDbTest, CountersTrackLookups) {
    cmdrunner::metrics::CounterRegistry counters;
    auto manager = std::make_shared<cmdrunner::metrics::LocalCounterManager>();
    counters.attach(manager);
    auto db = makeDb(nullptr, &counters);

    db->get("rsw1");
    db->get("rsw1");
    EXPECT_THROW(db->get("ghost", false), cmdrunner::DeviceNotFoundError);

    EXPECT_EQ(manager->getCounter("device_db.lookup"), 3);
    EXPECT_EQ(manager->getCounter("device_db.hit"), 1);
    EXPECT_EQ(manager->getCounter("device_db.miss"), 2);
    EXPECT_EQ(manager->getCounter("device_db.autofetch"), 1);
    EXPECT_EQ(manager->getCounter("device_db.autofetch.error"), 0);
}

TEST_F(DeviceDbTest, ConcurrentLookupsSeeConsistentSnapshots) {
    options_.updateInterval = 1ms;
    auto db = makeDb();
    db->start(group_);
    ASSERT_TRUE(db->waitForData());

    std::atomic<int> mismatches{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            for (int n = 0; n < 500; ++n) {
                auto device = db->get("rsw1");
                if (!device || device->hostname != "rsw001.p001.f01.ath1") {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}
