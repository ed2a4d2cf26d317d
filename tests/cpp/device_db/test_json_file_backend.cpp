#include "core/error_codes.h"
#include "device_db/json_file_backend.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using device_db::FetchRequest;
using device_db::JsonFileBackend;
using device_db::NameFilter;

namespace {

class JsonFileBackendTest : public ::testing::Test {
   protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("cmdrunner_devices_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
        path_ = dir_ / "devices.json";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    void writeFile(const std::string& content) {
        std::ofstream ofs(path_);
        ofs << content;
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
    daemon_core::CancellationSource source_;
};

const char* kInventory = R"({
    "devices": [
        {"hostname": "rsw001.p001.f01.ath1", "alias": "rsw1", "vendor": "arista",
         "address": "10.0.0.1", "attributes": {"role": "rsw"}},
        {"hostname": "fsw001.p001.f01.ath1", "alias": null, "vendor": "juniper"},
        {"hostname": "rsw002.p001.f01.ath1"}
    ]
})";

}  // namespace

TEST_F(JsonFileBackendTest, ReadsAllDevices) {
    writeFile(kInventory);
    JsonFileBackend backend(path_);

    auto devices = backend.fetchDevices(FetchRequest{}, source_.token());
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].hostname, "rsw001.p001.f01.ath1");
    ASSERT_TRUE(devices[0].alias.has_value());
    EXPECT_EQ(*devices[0].alias, "rsw1");
    EXPECT_EQ(devices[0].vendor, "arista");
    EXPECT_EQ(devices[0].address, "10.0.0.1");
    EXPECT_EQ(devices[0].attributes.at("role"), "rsw");
    EXPECT_FALSE(devices[1].alias.has_value());
    EXPECT_TRUE(devices[2].vendor.empty());
}

TEST_F(JsonFileBackendTest, NameFilterSelectsMatchingHostnames) {
    writeFile(kInventory);
    JsonFileBackend backend(path_);

    FetchRequest request;
    request.nameFilter = NameFilter("^rsw");
    auto devices = backend.fetchDevices(request, source_.token());
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].hostname, "rsw001.p001.f01.ath1");
    EXPECT_EQ(devices[1].hostname, "rsw002.p001.f01.ath1");
}

TEST_F(JsonFileBackendTest, PointFetchMatchesHostnameOrAlias) {
    writeFile(kInventory);
    JsonFileBackend backend(path_);

    FetchRequest byAlias;
    byAlias.hostname = "rsw1";
    auto devices = backend.fetchDevices(byAlias, source_.token());
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].hostname, "rsw001.p001.f01.ath1");

    FetchRequest unknown;
    unknown.hostname = "nope";
    EXPECT_TRUE(backend.fetchDevices(unknown, source_.token()).empty());
}

TEST_F(JsonFileBackendTest, TopLevelArrayAccepted) {
    writeFile(R"([{"hostname": "a"}, {"hostname": "b", "alias": "bee"}])");
    JsonFileBackend backend(path_);
    EXPECT_EQ(backend.fetchDevices(FetchRequest{}, source_.token()).size(), 2u);
}

TEST_F(JsonFileBackendTest, FileIsReReadOnEveryFetch) {
    writeFile(R"([{"hostname": "a"}])");
    JsonFileBackend backend(path_);
    EXPECT_EQ(backend.fetchDevices(FetchRequest{}, source_.token()).size(), 1u);

    writeFile(R"([{"hostname": "a"}, {"hostname": "b"}])");
    EXPECT_EQ(backend.fetchDevices(FetchRequest{}, source_.token()).size(), 2u);
}

TEST_F(JsonFileBackendTest, MissingFileIsBackendFailure) {
    JsonFileBackend backend(dir_ / "absent.json");
    try {
        backend.fetchDevices(FetchRequest{}, source_.token());
        FAIL() << "expected BackendError";
    } catch (const cmdrunner::BackendError& e) {
        EXPECT_EQ(e.code(), cmdrunner::ErrorCode::DEVICE_BACKEND_FAILED);
    }
}

TEST_F(JsonFileBackendTest, MalformedJsonIsInvalidData) {
    writeFile("{ not json");
    JsonFileBackend backend(path_);
    try {
        backend.fetchDevices(FetchRequest{}, source_.token());
        FAIL() << "expected BackendError";
    } catch (const cmdrunner::BackendError& e) {
        EXPECT_EQ(e.code(), cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
    }
}

TEST_F(JsonFileBackendTest, RecordsNeedStringHostname) {
    EXPECT_THROW(JsonFileBackend::parseDevices(nlohmann::json::parse(R"([{"alias": "x"}])")),
                 cmdrunner::BackendError);
    EXPECT_THROW(JsonFileBackend::parseDevices(nlohmann::json::parse(R"([{"hostname": 7}])")),
                 cmdrunner::BackendError);
    EXPECT_THROW(JsonFileBackend::parseDevices(nlohmann::json::parse(R"({"hosts": []})")),
                 cmdrunner::BackendError);
    EXPECT_THROW(JsonFileBackend::parseDevices(nlohmann::json::parse(R"({"devices": {}})")),
                 cmdrunner::BackendError);
}

TEST_F(JsonFileBackendTest, CancelledTokenStopsFetch) {
    writeFile(kInventory);
    JsonFileBackend backend(path_);
    source_.cancel();
    EXPECT_THROW(backend.fetchDevices(FetchRequest{}, source_.token()), cmdrunner::TaskCancelled);
}
