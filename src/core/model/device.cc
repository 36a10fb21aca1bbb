#include <core/exception.h>
#include <core/model/device.h>
#include <core/util/validator.h>
#include <ostream>

namespace devmon::core {

Device::Device(std::string_view name,
               std::string_view ip_address,
               long long port,
               long long timeout_seconds,
               bool enabled,
               std::optional<time::TimePoint> created_at)
    : name_(validator::ValidateName(name))
    , ip_address_(validator::ValidateIp(ip_address))
    , port_(validator::ValidatePort(port))
    , timeout_seconds_(validator::ValidateTimeout(timeout_seconds))
    , enabled_(enabled)
    , created_at_(created_at.value_or(time::Now())) {}

void Device::MarkChecked(bool online, time::TimePoint when) {
    is_online_ = online ? OnlineStatus::kOnline : OnlineStatus::kOffline;
    last_checked_ = when;
}

nlohmann::json Device::ToJson() const {
    return nlohmann::json{
        {"name", name_},
        {"ip_address", ip_address_},
        {"port", port_},
        {"timeout", timeout_seconds_},
        {"enabled", enabled_},
        {"created_at", time::ToIsoString(created_at_)},
        {"last_checked",
         last_checked_ ? nlohmann::json(time::ToIsoString(*last_checked_)) : nlohmann::json()},
        {"is_online", is_online_},
    };
}

long long ReadInteger(const nlohmann::json& j, const char* key, long long fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw ValidationError(std::string("Field \"") + key + "\" must be an integer");
    }
    return value.get<long long>();
}

static std::optional<time::TimePoint> readTimestamp(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    auto text = j.at(key).get<std::string>();
    auto tp = time::FromIsoString(text);
    if (!tp) {
        throw ValidationError(std::string("Invalid timestamp in field \"") + key + "\": " + text);
    }
    return tp;
}

Device Device::FromJson(const nlohmann::json& j) {
    // "timeout_seconds" is accepted as an alias of "timeout"
    long long timeout = probe::kDefaultTimeoutSeconds;
    if (j.contains("timeout")) {
        timeout = ReadInteger(j, "timeout", timeout);
    } else if (j.contains("timeout_seconds")) {
        timeout = ReadInteger(j, "timeout_seconds", timeout);
    }

    Device device(j.at("name").get<std::string>(),
                  j.at("ip_address").get<std::string>(),
                  ReadInteger(j, "port", probe::kDefaultPort),
                  timeout,
                  j.value("enabled", true),
                  readTimestamp(j, "created_at"));
    device.last_checked_ = readTimestamp(j, "last_checked");
    if (j.contains("is_online")) {
        device.is_online_ = j.at("is_online").get<OnlineStatus>();
    }
    return device;
}

std::ostream& operator<<(std::ostream& os, const Device& device) {
    return os << "Device (name=" << device.name() << ", ip_address=" << device.ip_address()
              << ", status=" << ToString(device.is_online()) << ")";
}

} // namespace devmon::core
