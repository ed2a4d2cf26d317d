/**
 * @file device_db.cpp
 * @brief Device directory cache: bulk refresh, point fetch and merge
 */

#include "device_db/device_db.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "logging/metrics.h"

namespace device_db {

namespace {

constexpr const char* COUNTER_LOOKUP = "device_db.lookup";
constexpr const char* COUNTER_HIT = "device_db.hit";
constexpr const char* COUNTER_MISS = "device_db.miss";
constexpr const char* COUNTER_AUTOFETCH = "device_db.autofetch";
constexpr const char* COUNTER_AUTOFETCH_ERROR = "device_db.autofetch.error";
constexpr const char* COUNTER_REFRESH_DEVICES = "device_db.refresh.devices";

}  // namespace

NameFilter::NameFilter(const std::string& pattern) : pattern_(pattern) {
    try {
        regex_ = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw cmdrunner::ConfigError("Invalid device name filter '" + pattern + "': " + e.what(),
                                     cmdrunner::ErrorCode::VALIDATION_INVALID_NAME_FILTER);
    }
}

bool NameFilter::matches(const std::string& hostname) const {
    return std::regex_search(hostname, regex_);
}

DeviceDb::DeviceDb(std::shared_ptr<DeviceBackend> backend, DeviceDbOptions options,
                   daemon_core::ThreadPool* executor,
                   cmdrunner::metrics::CounterRegistry* counters)
    : PeriodicTask(TASK_NAME, options.updateInterval),
      backend_(std::move(backend)),
      executor_(executor) {
    if (!backend_) {
        throw cmdrunner::ConfigError("DeviceDb requires a backend");
    }
    if (options.nameFilter) {
        nameFilter_.emplace(*options.nameFilter);
    }
    setReadyPollInterval(options.readyPollInterval);
    setCounters(counters);
    if (counters) {
        counters->declare({COUNTER_LOOKUP, COUNTER_HIT, COUNTER_MISS, COUNTER_AUTOFETCH,
                           COUNTER_AUTOFETCH_ERROR, COUNTER_REFRESH_DEVICES});
    }
}

DeviceDb::~DeviceDb() {
    stop();
}

void DeviceDb::run(const daemon_core::CancellationToken& token) {
    FetchRequest request;
    request.nameFilter = nameFilter_;

    LOG_DEBUG("Device refresh starting (filter: {})",
              nameFilter_ ? nameFilter_->pattern() : std::string("<none>"));
    auto devices = fetch(request, token);
    merge(devices);
    count(COUNTER_REFRESH_DEVICES, static_cast<int64_t>(devices.size()));
    LOG_INFO("Device refresh complete: {} device(s), {} index entries", devices.size(), size());
    markReady();
}

DevicePtr DeviceDb::get(const std::string& name, bool autofetch) {
    count(COUNTER_LOOKUP);
    if (auto device = find(name)) {
        count(COUNTER_HIT);
        return device;
    }
    count(COUNTER_MISS);

    if (!autofetch) {
        throw cmdrunner::DeviceNotFoundError(name);
    }

    count(COUNTER_AUTOFETCH);
    LOG_DEBUG("Device '{}' not cached, fetching", name);

    FetchRequest request;
    request.hostname = name;
    std::vector<Device> devices;
    try {
        devices = fetch(request, token());
    } catch (const cmdrunner::ServiceError&) {
        count(COUNTER_AUTOFETCH_ERROR);
        throw;
    } catch (const std::exception& e) {
        count(COUNTER_AUTOFETCH_ERROR);
        throw cmdrunner::BackendError("Fetching device '" + name + "' failed: " + e.what());
    }

    merge(devices, name);

    if (auto device = find(name)) {
        return device;
    }
    throw cmdrunner::DeviceNotFoundError(name);
}

DevicePtr DeviceDb::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(indexMutex_);
    auto it = index_.find(name);
    return it != index_.end() ? it->second : nullptr;
}

size_t DeviceDb::size() const {
    std::lock_guard<std::mutex> lock(indexMutex_);
    return index_.size();
}

std::vector<Device> DeviceDb::fetch(const FetchRequest& request,
                                    const daemon_core::CancellationToken& token) {
    if (!executor_) {
        return backend_->fetchDevices(request, token);
    }
    auto backend = backend_;
    auto future = executor_->submit(
        [backend, request, token]() { return backend->fetchDevices(request, token); });
    return daemon_core::waitCancellable(future, token, TASK_NAME);
}

void DeviceDb::merge(const std::vector<Device>& devices,
                     const std::optional<std::string>& requestedName) {
    std::vector<DevicePtr> snapshots;
    snapshots.reserve(devices.size());
    for (const auto& device : devices) {
        if (device.hostname.empty()) {
            LOG_WARN("Skipping device record without hostname");
            continue;
        }
        snapshots.push_back(std::make_shared<const Device>(device));
    }

    std::lock_guard<std::mutex> lock(indexMutex_);
    for (const auto& snapshot : snapshots) {
        index_[snapshot->hostname] = snapshot;
        if (snapshot->alias && !snapshot->alias->empty()) {
            index_[*snapshot->alias] = snapshot;
        }
    }

    // A point fetch may return the canonical record under another name; a
    // single unambiguous result is also made reachable by the requested name.
    if (requestedName && snapshots.size() == 1 && !snapshots.front()->answersTo(*requestedName)) {
        LOG_DEBUG("Indexing '{}' under requested name '{}'", snapshots.front()->hostname,
                  *requestedName);
        index_[*requestedName] = snapshots.front();
    }
}

void DeviceDb::count(const std::string& name, int64_t delta) {
    if (auto* registry = counters()) {
        registry->increment(name, delta);
    }
}

}  // namespace device_db
