#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace devmon::core {

namespace probe {

constexpr std::uint16_t kDefaultPort = 80;
constexpr int kDefaultTimeoutSeconds = 5;

// Tried in this order after the device's own port, which is skipped if listed
constexpr std::array<std::uint16_t, 4> kDefaultFallbackPorts = {443, 80, 22, 8080};

constexpr std::chrono::seconds kDefaultPingTimeout{2};

constexpr std::size_t kMinCheckWorkers = 2;
constexpr std::size_t kMaxCheckWorkers = 32;

} // namespace probe

namespace schedule {

constexpr std::chrono::seconds kDefaultCheckInterval{300}; // 5 minutes
constexpr std::chrono::seconds kTaskJoinTimeout{2};

constexpr auto kAutoCheckTaskName = "auto_check";

} // namespace schedule

} // namespace devmon::core
