#pragma once

#include "daemon/core/cancellation.h"
#include "device_db/device.h"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace device_db {

/**
 * @brief Compiled hostname filter for bulk refreshes
 *
 * Matches when the pattern is found anywhere in the hostname.
 */
class NameFilter {
   public:
    /**
     * @throws cmdrunner::ConfigError (VALIDATION_INVALID_NAME_FILTER) on a malformed pattern
     */
    explicit NameFilter(const std::string& pattern);

    bool matches(const std::string& hostname) const;

    const std::string& pattern() const {
        return pattern_;
    }

   private:
    std::string pattern_;
    std::regex regex_;
};

/**
 * @brief Arguments of one backend fetch
 *
 * Bulk refreshes set only nameFilter; point fetches set only hostname.
 * Neither set means "everything".
 */
struct FetchRequest {
    std::optional<NameFilter> nameFilter;
    std::optional<std::string> hostname;
};

/**
 * @brief Source of device records
 *
 * Implementations must be idempotent and safe to call concurrently (a point
 * fetch may overlap a bulk refresh). Errors are reported by throwing; long
 * calls should poll token and throw cmdrunner::TaskCancelled when cancelled.
 */
class DeviceBackend {
   public:
    virtual ~DeviceBackend() = default;

    virtual std::vector<Device> fetchDevices(const FetchRequest& request,
                                             const daemon_core::CancellationToken& token) = 0;
};

}  // namespace device_db
