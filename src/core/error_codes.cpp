#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace cmdrunner {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Device directory
    {ErrorCode::DEVICE_NOT_FOUND, "DEVICE_NOT_FOUND"},
    {ErrorCode::DEVICE_BACKEND_FAILED, "DEVICE_BACKEND_FAILED"},
    {ErrorCode::DEVICE_BACKEND_INVALID_DATA, "DEVICE_BACKEND_INVALID_DATA"},

    // Lifecycle / tasks
    {ErrorCode::TASK_CANCELLED, "TASK_CANCELLED"},
    {ErrorCode::TASK_GROUP_CLOSED, "TASK_GROUP_CLOSED"},
    {ErrorCode::EXECUTOR_SHUTDOWN, "EXECUTOR_SHUTDOWN"},
    {ErrorCode::SHUTDOWN_DRAIN_TIMEOUT, "SHUTDOWN_DRAIN_TIMEOUT"},
    {ErrorCode::LIFECYCLE_STOPPED, "LIFECYCLE_STOPPED"},

    // Sessions
    {ErrorCode::SESSION_DUPLICATE_ID, "SESSION_DUPLICATE_ID"},
    {ErrorCode::SESSION_REGISTRY_CLOSED, "SESSION_REGISTRY_CLOSED"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_INVALID_LOG_LEVEL, "VALIDATION_INVALID_LOG_LEVEL"},
    {ErrorCode::VALIDATION_INVALID_NAME_FILTER, "VALIDATION_INVALID_NAME_FILTER"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isDeviceError(code)) {
        return "device_db";
    }
    if (isLifecycleError(code)) {
        return "lifecycle";
    }
    if (isSessionError(code)) {
        return "session";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ServiceError::ServiceError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

DeviceNotFoundError::DeviceNotFoundError(const std::string& deviceName)
    : ServiceError(ErrorCode::DEVICE_NOT_FOUND, "Device not found: " + deviceName),
      deviceName_(deviceName) {}

BackendError::BackendError(const std::string& message, ErrorCode code)
    : ServiceError(code, message) {}

ConfigError::ConfigError(const std::string& message, ErrorCode code)
    : ServiceError(code, message) {}

TaskCancelled::TaskCancelled(const std::string& taskName)
    : ServiceError(ErrorCode::TASK_CANCELLED, "Task cancelled: " + taskName) {}

}  // namespace cmdrunner
