#pragma once

#include <core/model/device.h>
#include <core/network/prober/reachability_prober.h>
#include <core/storage/device_repository.h>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace devmon::core {

/**
 * @brief Manages devices and checks their status.
 *
 * @details Keeps the session's device list, loaded from the repository on construction.
 * The repository is the single owner of truth: after every mutation and every full check
 * the list is reloaded from it instead of being patched in place.
 */
class DeviceService {
public:
    explicit DeviceService(DeviceRepository& repository,
                           ProbeOptions options = ProbeOptions::Defaults());
    DeviceService(const DeviceService&) = delete;
    DeviceService& operator=(const DeviceService&) = delete;

    std::vector<Device> GetAllDevices() const;

    // false on invalid input, a duplicate name or a failed write
    bool AddDevice(std::string_view name,
                   std::string_view ip_address,
                   long long port = probe::kDefaultPort,
                   long long timeout_seconds = probe::kDefaultTimeoutSeconds);
    bool RemoveDevice(std::string_view name);

    bool CheckDeviceStatus(Device& device);

    // Probes every enabled device concurrently; returns once all probes have finished
    void CheckAllDevices();

    bool EnableDevice(std::string_view name);
    bool DisableDevice(std::string_view name);

    ReachabilityProber& prober() { return prober_; }

private:
    DeviceRepository& repository_;
    ReachabilityProber prober_;
    mutable std::mutex devices_mutex_;
    std::vector<Device> devices_;

    void reload();
    bool setEnabled(std::string_view name, bool enabled);
};

} // namespace devmon::core
