/*
    config.h
    This header provides functionality for managing application configuration
    using TOML files. It includes utilities for reading and writing general
    configuration values as well as the monitor settings.

    Example usage:

    General configuration:
    - Read a value from the general config:
        T value = devmon::core::config["key"].value_or(default_value);

    Monitor settings:
    - Read a setting:
        std::chrono::seconds interval = devmon::core::settings.check_interval;
        bool auto_check = devmon::core::settings.auto_check;
        std::vector<std::uint16_t> ports = devmon::core::settings.fallback_ports;
    - Write a setting:
        devmon::core::settings.check_interval = std::chrono::seconds(60);
        devmon::core::settings.auto_check = false;

    Initialization and saving:
    - Initialize the configuration (loads from file or creates default):
        devmon::core::InitConfig();
    - Save the current configuration to file:
        devmon::core::SaveConfig();
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>
#include <vector>

namespace devmon::core {

inline toml::table config;

struct Settings {
    std::chrono::seconds check_interval;       // Period of the auto-check task
    bool auto_check;                           // Whether to schedule the auto-check task at all
    std::vector<std::uint16_t> fallback_ports; // Second probe tier, in order
    std::chrono::seconds ping_timeout;         // Third probe tier
    std::string log_level;                     // spdlog level name
    std::filesystem::path devices_file;
};

inline Settings settings;

void InitConfig();

void SaveConfig();

} // namespace devmon::core
