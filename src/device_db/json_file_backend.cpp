#include "device_db/json_file_backend.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <fstream>

namespace device_db {

namespace {

Device parseDevice(const nlohmann::json& entry) {
    if (!entry.is_object()) {
        throw cmdrunner::BackendError("Device record must be an object",
                                      cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
    }
    if (!entry.contains("hostname") || !entry["hostname"].is_string()) {
        throw cmdrunner::BackendError("Device record without string 'hostname'",
                                      cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
    }

    Device device;
    try {
        device.hostname = entry["hostname"].get<std::string>();
        if (entry.contains("alias") && !entry["alias"].is_null()) {
            device.alias = entry["alias"].get<std::string>();
        }
        if (entry.contains("vendor")) {
            device.vendor = entry["vendor"].get<std::string>();
        }
        if (entry.contains("address")) {
            device.address = entry["address"].get<std::string>();
        }
        if (entry.contains("attributes")) {
            device.attributes = entry["attributes"].get<std::map<std::string, std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw cmdrunner::BackendError(
            "Invalid device record '" + device.hostname + "': " + e.what(),
            cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
    }
    return device;
}

}  // namespace

JsonFileBackend::JsonFileBackend(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<Device> JsonFileBackend::parseDevices(const nlohmann::json& j) {
    const nlohmann::json* list = &j;
    if (j.is_object()) {
        if (!j.contains("devices")) {
            throw cmdrunner::BackendError("Device file has no 'devices' array",
                                          cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
        }
        list = &j["devices"];
    }
    if (!list->is_array()) {
        throw cmdrunner::BackendError("Device list must be a JSON array",
                                      cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
    }

    std::vector<Device> devices;
    devices.reserve(list->size());
    for (const auto& entry : *list) {
        devices.push_back(parseDevice(entry));
    }
    return devices;
}

std::vector<Device> JsonFileBackend::fetchDevices(const FetchRequest& request,
                                                  const daemon_core::CancellationToken& token) {
    token.throwIfCancelled("json_file_backend");

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw cmdrunner::BackendError("Cannot open device file: " + path_.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw cmdrunner::BackendError("Failed to parse device file " + path_.string() + ": " +
                                          e.what(),
                                      cmdrunner::ErrorCode::DEVICE_BACKEND_INVALID_DATA);
    }

    std::vector<Device> all = parseDevices(j);
    std::vector<Device> selected;
    for (auto& device : all) {
        if (request.hostname && !device.answersTo(*request.hostname)) {
            continue;
        }
        if (request.nameFilter && !request.nameFilter->matches(device.hostname)) {
            continue;
        }
        selected.push_back(std::move(device));
    }

    LOG_DEBUG("Device file {}: {} of {} record(s) selected", path_.string(), selected.size(),
              all.size());
    return selected;
}

}  // namespace device_db
