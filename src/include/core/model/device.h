#pragma once

#include "online_status.h"
#include <core/constant/probe.h>
#include <core/util/time.h>
#include <cstdint>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace devmon::core {

/**
 * @brief One monitored network endpoint.
 *
 * @details Name, address, port and timeout are validated by the constructor and cannot
 * be changed afterwards, so a Device never exists in an invalid state. Status fields are
 * written by the prober only, through MarkChecked().
 */
class Device {
public:
    // Throws ValidationError
    Device(std::string_view name,
           std::string_view ip_address,
           long long port = probe::kDefaultPort,
           long long timeout_seconds = probe::kDefaultTimeoutSeconds,
           bool enabled = true,
           std::optional<time::TimePoint> created_at = std::nullopt);

    const std::string& name() const { return name_; }
    const std::string& ip_address() const { return ip_address_; }
    std::uint16_t port() const { return port_; }
    int timeout_seconds() const { return timeout_seconds_; }
    bool enabled() const { return enabled_; }
    time::TimePoint created_at() const { return created_at_; }
    const std::optional<time::TimePoint>& last_checked() const { return last_checked_; }
    OnlineStatus is_online() const { return is_online_; }

    void SetEnabled(bool enabled) { enabled_ = enabled; }
    void MarkChecked(bool online, time::TimePoint when = time::Now());

    nlohmann::json ToJson() const;

    // Throws ValidationError for out-of-range fields and nlohmann::json::exception for
    // a record of the wrong shape
    static Device FromJson(const nlohmann::json& j);

    bool operator==(const Device&) const = default;

private:
    std::string name_;
    std::string ip_address_;
    std::uint16_t port_;
    int timeout_seconds_;
    bool enabled_;
    time::TimePoint created_at_;
    std::optional<time::TimePoint> last_checked_;
    OnlineStatus is_online_{OnlineStatus::kUnknown};
};

std::ostream& operator<<(std::ostream& os, const Device& device);

// Integer field of a device record, fallback when absent. Floats, strings and booleans
// throw ValidationError rather than being truncated or coerced.
long long ReadInteger(const nlohmann::json& j, const char* key, long long fallback);

} // namespace devmon::core

namespace nlohmann {

template<>
struct adl_serializer<devmon::core::Device> {
    static devmon::core::Device from_json(const json& j) {
        return devmon::core::Device::FromJson(j);
    }
    static void to_json(json& j, const devmon::core::Device& device) { j = device.ToJson(); }
};

} // namespace nlohmann
