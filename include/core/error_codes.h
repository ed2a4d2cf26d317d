#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cmdrunner {

/**
 * @brief Error codes for the command runner service.
 *
 * Categories use upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: Device directory
 * - 0x2xxx: Lifecycle / background tasks
 * - 0x3xxx: Command sessions
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Device directory (0x1000)
    DEVICE_NOT_FOUND = 0x1001,
    DEVICE_BACKEND_FAILED = 0x1002,
    DEVICE_BACKEND_INVALID_DATA = 0x1003,

    // Lifecycle / tasks (0x2000)
    TASK_CANCELLED = 0x2001,
    TASK_GROUP_CLOSED = 0x2002,
    EXECUTOR_SHUTDOWN = 0x2003,
    SHUTDOWN_DRAIN_TIMEOUT = 0x2004,
    LIFECYCLE_STOPPED = 0x2005,

    // Sessions (0x3000)
    SESSION_DUPLICATE_ID = 0x3001,
    SESSION_REGISTRY_CLOSED = 0x3002,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_LOG_LEVEL = 0x5002,
    VALIDATION_INVALID_NAME_FILTER = 0x5003,
    VALIDATION_FILE_NOT_FOUND = 0x5004,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "DEVICE_NOT_FOUND"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "device_db"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x1001")
 */
std::string errorCodeToHex(ErrorCode code);

// Category check helpers
constexpr bool isDeviceError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isLifecycleError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isSessionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

// ========== Exceptions ==========

class ServiceError : public std::runtime_error {
   public:
    ServiceError(ErrorCode code, const std::string& message);

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

/**
 * @brief Lookup miss in the device directory.
 *
 * Distinct from BackendError so callers can tell "unknown device" apart from
 * "backend currently unavailable".
 */
class DeviceNotFoundError : public ServiceError {
   public:
    explicit DeviceNotFoundError(const std::string& deviceName);

    const std::string& deviceName() const {
        return deviceName_;
    }

   private:
    std::string deviceName_;
};

class BackendError : public ServiceError {
   public:
    explicit BackendError(const std::string& message,
                          ErrorCode code = ErrorCode::DEVICE_BACKEND_FAILED);
};

class ConfigError : public ServiceError {
   public:
    explicit ConfigError(const std::string& message,
                         ErrorCode code = ErrorCode::VALIDATION_INVALID_CONFIG);
};

/**
 * @brief Thrown out of blocking waits when the owning task was cancelled.
 */
class TaskCancelled : public ServiceError {
   public:
    explicit TaskCancelled(const std::string& taskName);
};

}  // namespace cmdrunner

#endif  // ERROR_CODES_H
