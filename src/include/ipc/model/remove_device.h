#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace devmon::ipc::operation {

struct RemoveDevice {
    std::string name;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RemoveDevice, name);
};

} // namespace devmon::ipc::operation
