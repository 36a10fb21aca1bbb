#pragma once

#include <nlohmann/json.hpp>

namespace devmon::core {

// "Never checked" is kept apart from "last check failed"
enum class OnlineStatus {
    kUnknown,
    kOnline,
    kOffline,
};

// On disk the status is null / true / false
inline void to_json(nlohmann::json& j, OnlineStatus status) {
    switch (status) {
    case OnlineStatus::kOnline:
        j = true;
        break;
    case OnlineStatus::kOffline:
        j = false;
        break;
    case OnlineStatus::kUnknown:
        j = nullptr;
        break;
    }
}

inline void from_json(const nlohmann::json& j, OnlineStatus& status) {
    if (j.is_null()) {
        status = OnlineStatus::kUnknown;
    } else {
        status = j.get<bool>() ? OnlineStatus::kOnline : OnlineStatus::kOffline;
    }
}

inline const char* ToString(OnlineStatus status) {
    switch (status) {
    case OnlineStatus::kOnline:
        return "Online";
    case OnlineStatus::kOffline:
        return "Offline";
    case OnlineStatus::kUnknown:
        break;
    }
    return "Unknown";
}

} // namespace devmon::core
