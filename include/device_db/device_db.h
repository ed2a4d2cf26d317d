/**
 * @file device_db.h
 * @brief Periodically refreshed, alias-aware device directory cache
 *
 * A bulk refresh runs every update interval and merges every fetched device
 * under its hostname and alias. A lookup miss triggers a point fetch for the
 * requested name (bypassing the schedule) before failing. Entries are never
 * evicted; a later merge for the same name replaces the entry.
 */

#pragma once

#include "daemon/core/periodic_task.h"
#include "daemon/core/thread_pool.h"
#include "device_db/device.h"
#include "device_db/device_backend.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdrunner {
namespace metrics {
class CounterRegistry;
}
}  // namespace cmdrunner

namespace device_db {

struct DeviceDbOptions {
    std::chrono::milliseconds updateInterval{std::chrono::seconds(1800)};
    std::optional<std::string> nameFilter;  // Regex applied to bulk refreshes
    std::chrono::milliseconds readyPollInterval{1000};
};

class DeviceDb : public daemon_core::PeriodicTask {
   public:
    static constexpr const char* TASK_NAME = "device_db";

    /**
     * @param executor When set, backend calls run on the pool and the caller
     *                 waits cancellably; otherwise they run inline
     * @throws cmdrunner::ConfigError if options.nameFilter is not a valid regex
     */
    DeviceDb(std::shared_ptr<DeviceBackend> backend, DeviceDbOptions options,
             daemon_core::ThreadPool* executor = nullptr,
             cmdrunner::metrics::CounterRegistry* counters = nullptr);
    ~DeviceDb() override;

    /**
     * @brief Look up a device by hostname or alias
     *
     * On a miss with autofetch, fetches name from the backend, merges the
     * result and retries the lookup.
     *
     * @throws cmdrunner::DeviceNotFoundError if the device is still unknown
     * @throws cmdrunner::BackendError if the point fetch failed
     */
    DevicePtr get(const std::string& name, bool autofetch = true);

    /**
     * @brief Cached lookup only; nullptr on miss
     */
    DevicePtr find(const std::string& name) const;

    bool waitForData() {
        return waitForReady();
    }

    bool isDataValid() const {
        return isReady();
    }

    /// Number of index entries (hostnames, aliases and requested-name entries)
    size_t size() const;

    const std::optional<NameFilter>& nameFilter() const {
        return nameFilter_;
    }

   protected:
    void run(const daemon_core::CancellationToken& token) override;

   private:
    std::vector<Device> fetch(const FetchRequest& request,
                              const daemon_core::CancellationToken& token);
    void merge(const std::vector<Device>& devices,
               const std::optional<std::string>& requestedName = std::nullopt);
    void count(const std::string& name, int64_t delta = 1);

    std::shared_ptr<DeviceBackend> backend_;
    std::optional<NameFilter> nameFilter_;
    daemon_core::ThreadPool* executor_;

    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, DevicePtr> index_;
};

}  // namespace device_db
