#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace devmon::ipc::operation {

struct SetDeviceEnabled {
    std::string name;
    bool enabled;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(SetDeviceEnabled, name, enabled);
};

} // namespace devmon::ipc::operation
