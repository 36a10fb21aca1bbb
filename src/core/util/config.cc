#include <core/constant/path.h>
#include <core/constant/probe.h>
#include <core/util/config.h>
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>

namespace devmon::core {

static void LoadSetting() {
    if (!config.contains("setting")) {
        config.insert("setting", toml::table{});
    }
    auto& setting = config["setting"].ref<toml::table>();

    auto interval = setting["check-interval"].value_or(
        static_cast<std::int64_t>(schedule::kDefaultCheckInterval.count()));
    if (interval < 1) {
        spdlog::warn("check-interval {} is not positive, using default", interval);
        interval = static_cast<std::int64_t>(schedule::kDefaultCheckInterval.count());
    }
    settings.check_interval = std::chrono::seconds(interval);

    settings.auto_check = setting["auto-check"].value_or(true);

    settings.fallback_ports.clear();
    if (auto* ports = setting["fallback-ports"].as_array(); ports) {
        for (const auto& node : *ports) {
            auto port = node.value<std::int64_t>();
            if (port && *port >= 1 && *port <= 65535) {
                settings.fallback_ports.push_back(static_cast<std::uint16_t>(*port));
            } else {
                spdlog::warn("Ignoring invalid entry in fallback-ports");
            }
        }
    } else {
        settings.fallback_ports.assign(probe::kDefaultFallbackPorts.begin(),
                                       probe::kDefaultFallbackPorts.end());
    }

    auto ping_timeout = setting["ping-timeout"].value_or(
        static_cast<std::int64_t>(probe::kDefaultPingTimeout.count()));
    settings.ping_timeout = std::chrono::seconds(std::max<std::int64_t>(1, ping_timeout));

    settings.log_level = setting["log-level"].value_or(std::string("info"));
    settings.devices_file = setting["devices-file"].value_or(path::kDevicesFile.string());
}

void InitConfig() {
    if (!std::filesystem::exists(path::kConfigDir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::error_code ec;
        std::filesystem::create_directories(path::kConfigDir, ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", path::kConfigDir.string(), ec.message());
        }
    }
    auto path = path::kConfigDir / "config.toml";
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();
}

void SaveConfig() {
    auto path = path::kConfigDir / "config.toml";
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }
    toml::array ports;
    for (auto port : settings.fallback_ports) {
        ports.push_back(static_cast<std::int64_t>(port));
    }
    config.insert_or_assign("setting",
                            toml::table{
                                {"check-interval", static_cast<std::int64_t>(settings.check_interval.count())},
                                {"auto-check", settings.auto_check},
                                {"fallback-ports", std::move(ports)},
                                {"ping-timeout", static_cast<std::int64_t>(settings.ping_timeout.count())},
                                {"log-level", settings.log_level},
                                {"devices-file", settings.devices_file.string()},
                            });
    ofs << config;
}

} // namespace devmon::core
