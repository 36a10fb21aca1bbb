#pragma once

#include <chrono>
#include <core/model/device.h>
#include <core/storage/device_repository.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace devmon::core {

struct ProbeOptions {
    std::vector<std::uint16_t> fallback_ports;
    std::chrono::seconds ping_timeout;

    static ProbeOptions Defaults();
    static ProbeOptions FromConfigSettings();
};

/**
 * @brief Determines whether a device is reachable.
 *
 * @details Tiers run strictly in order and stop at the first success:
 *  1. TCP connect to the device's own port
 *  2. TCP connect to each fallback port, skipping the device's own port
 *  3. one echo request through the system ping
 *
 * Every outcome is written back to the device and persisted through the repository.
 */
class ReachabilityProber {
public:
    using TcpConnectFunc = std::function<bool(const std::string&, std::uint16_t, std::chrono::seconds)>;
    using PingFunc = std::function<bool(const std::string&, std::chrono::seconds)>;

    ReachabilityProber(DeviceRepository& repository, ProbeOptions options = ProbeOptions::Defaults());

    // Updates device's status and last_checked, persists it, and returns the status
    bool CheckDeviceStatus(Device& device);

    const ProbeOptions& options() const { return options_; }

    // Replaces the transport of a tier, e.g. to observe the attempt order
    void SetTcpConnectFunc(TcpConnectFunc func) { tcp_connect_ = std::move(func); }
    void SetPingFunc(PingFunc func) { ping_ = std::move(func); }

private:
    DeviceRepository& repository_;
    ProbeOptions options_;
    TcpConnectFunc tcp_connect_;
    PingFunc ping_;

    bool probe(const Device& device);
};

} // namespace devmon::core
