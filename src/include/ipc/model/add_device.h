#pragma once

#include <core/constant/probe.h>
#include <core/model/device.h>
#include <nlohmann/json.hpp>
#include <string>

namespace devmon::ipc::operation {

// Range checks are left to the Device constructor; non-integer numbers throw ValidationError
struct AddDevice {
    std::string name;
    std::string ip_address;
    long long port = core::probe::kDefaultPort;
    long long timeout = core::probe::kDefaultTimeoutSeconds;

    friend void to_json(nlohmann::json& j, const AddDevice& op) {
        j = nlohmann::json{
            {"name", op.name},
            {"ip_address", op.ip_address},
            {"port", op.port},
            {"timeout", op.timeout},
        };
    }

    friend void from_json(const nlohmann::json& j, AddDevice& op) {
        j.at("name").get_to(op.name);
        j.at("ip_address").get_to(op.ip_address);
        op.port = core::ReadInteger(j, "port", core::probe::kDefaultPort);
        op.timeout = core::ReadInteger(j, "timeout", core::probe::kDefaultTimeoutSeconds);
    }
};

} // namespace devmon::ipc::operation
