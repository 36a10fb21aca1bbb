#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace devmon::core::feedback {

struct BackendStarted {
    std::string version;
    std::string platform;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(BackendStarted, version, platform);

    static BackendStarted Current() {
        return BackendStarted{
            .version = DEVMON_VERSION,
            .platform =
#ifdef _WIN32
                "windows",
#elif defined(__APPLE__)
                "macos",
#else
                "linux",
#endif
        };
    }
};

} // namespace devmon::core::feedback
