#pragma once

#include "core/model/device.h"
#include <nlohmann/json.hpp>
#include <vector>

namespace devmon::core::feedback {

// Payload of DevicesChecked and DeviceList; only ever sent, never parsed back
struct DeviceList {
    std::vector<Device> devices;

    friend void to_json(nlohmann::json& j, const DeviceList& list) {
        j = nlohmann::json{{"devices", nlohmann::json::array()}};
        for (const auto& device : list.devices) {
            j["devices"].push_back(device.ToJson());
        }
    }
};

} // namespace devmon::core::feedback
