#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace devmon::core::feedback {

struct DeviceEnabledChanged {
    std::string name;
    bool enabled;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DeviceEnabledChanged, name, enabled);
};

} // namespace devmon::core::feedback
