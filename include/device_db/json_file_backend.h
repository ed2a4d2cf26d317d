#pragma once

#include "device_db/device_backend.h"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace device_db {

/**
 * @brief DeviceBackend reading a JSON device inventory
 *
 * The file is re-read on every fetch so edits are picked up by the next
 * refresh. Accepted layouts:
 *   {"devices": [{"hostname": "...", "alias": "...", ...}, ...]}
 *   [{"hostname": "...", ...}, ...]
 */
class JsonFileBackend : public DeviceBackend {
   public:
    explicit JsonFileBackend(std::filesystem::path path);

    std::vector<Device> fetchDevices(const FetchRequest& request,
                                     const daemon_core::CancellationToken& token) override;

    const std::filesystem::path& path() const {
        return path_;
    }

    /**
     * @throws cmdrunner::BackendError (DEVICE_BACKEND_INVALID_DATA) on malformed records
     */
    static std::vector<Device> parseDevices(const nlohmann::json& j);

   private:
    std::filesystem::path path_;
};

}  // namespace device_db
