#include <algorithm>
#include <core/constant/probe.h>
#include <core/network/prober/reachability_prober.h>
#include <core/network/prober/tcp_connector.h>
#include <core/util/config.h>
#include <core/util/system.h>
#include <spdlog/spdlog.h>

namespace devmon::core {

ProbeOptions ProbeOptions::Defaults() {
    return ProbeOptions{
        .fallback_ports = {probe::kDefaultFallbackPorts.begin(), probe::kDefaultFallbackPorts.end()},
        .ping_timeout = probe::kDefaultPingTimeout,
    };
}

ProbeOptions ProbeOptions::FromConfigSettings() {
    return ProbeOptions{
        .fallback_ports = settings.fallback_ports,
        .ping_timeout = settings.ping_timeout,
    };
}

ReachabilityProber::ReachabilityProber(DeviceRepository& repository, ProbeOptions options)
    : repository_(repository)
    , options_(std::move(options))
    , tcp_connect_(TcpConnect)
    , ping_(system::Ping) {}

bool ReachabilityProber::CheckDeviceStatus(Device& device) {
    bool online = false;
    try {
        online = probe(device);
    } catch (const std::exception& e) {
        spdlog::error("Error checking device {}: {}", device.name(), e.what());
        online = false;
    }

    device.MarkChecked(online);
    if (!repository_.UpdateDevice(device)) {
        spdlog::warn("Status of {} could not be persisted", device.name());
    }
    spdlog::debug("Device {} is {}", device.name(), online ? "online" : "offline");
    return online;
}

bool ReachabilityProber::probe(const Device& device) {
    const auto timeout = std::chrono::seconds(std::max(1, device.timeout_seconds()));

    if (tcp_connect_(device.ip_address(), device.port(), timeout)) {
        return true;
    }

    for (auto port : options_.fallback_ports) {
        if (port == device.port()) {
            continue;
        }
        if (tcp_connect_(device.ip_address(), port, timeout)) {
            spdlog::debug("Device {} answered on fallback port {}", device.name(), port);
            return true;
        }
    }

    if (ping_(device.ip_address(), options_.ping_timeout)) {
        spdlog::debug("Device {} answered ping", device.name());
        return true;
    }
    return false;
}

} // namespace devmon::core
