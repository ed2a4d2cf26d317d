#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace device_db {

/**
 * @brief One entry of the device directory
 *
 * Only hostname and alias are interpreted by the cache; the other fields are
 * carried through for callers.
 */
struct Device {
    std::string hostname;
    std::optional<std::string> alias;
    std::string vendor;
    std::string address;
    std::map<std::string, std::string> attributes;

    bool answersTo(const std::string& name) const {
        return hostname == name || (alias && *alias == name);
    }
};

inline bool operator==(const Device& a, const Device& b) {
    return a.hostname == b.hostname && a.alias == b.alias && a.vendor == b.vendor &&
           a.address == b.address && a.attributes == b.attributes;
}

inline bool operator!=(const Device& a, const Device& b) {
    return !(a == b);
}

// Index entries are immutable snapshots; a refresh replaces the pointer
using DevicePtr = std::shared_ptr<const Device>;

}  // namespace device_db
