#pragma once

#include <cstdlib>
#include <filesystem>

namespace devmon::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
#if defined(_WIN32) || defined(_WIN64)
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home == nullptr) {
        return std::filesystem::temp_directory_path();
    }
    return std::filesystem::path(home);
}();

// devices.json and logs/ live here
inline const std::filesystem::path kDataDir =
#if defined(_WIN32) || defined(_WIN64)
    (std::getenv("APPDATA") ? std::filesystem::path(std::getenv("APPDATA")) : kHomeDir)
    / "DevMonitor";
#elif defined(__APPLE__)
    kHomeDir / "Library" / "Application Support" / "DevMonitor";
#else
    kHomeDir / ".local" / "share" / "DevMonitor";
#endif

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    kDataDir;
#else
    kHomeDir / ".config" / "DevMonitor";
#endif

inline const std::filesystem::path kLogDir = kDataDir / "logs";

inline const std::filesystem::path kDevicesFile = kDataDir / "devices.json";

} // namespace path
} // namespace devmon::core
