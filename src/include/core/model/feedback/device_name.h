#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace devmon::core::feedback {

// Payload of DeviceAdded, DeviceAddFailed, DeviceRemoved, DeviceRemoveFailed and
// DeviceEnableFailed
struct DeviceName {
    std::string name;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DeviceName, name);
};

} // namespace devmon::core::feedback
