#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <core/constant/probe.h>
#include <core/exception.h>
#include <core/service/device_service.h>
#include <iterator>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace devmon::core {

DeviceService::DeviceService(DeviceRepository& repository, ProbeOptions options)
    : repository_(repository)
    , prober_(repository, std::move(options)) {
    reload();
    spdlog::info("Device service loaded {} devices", devices_.size());
}

std::vector<Device> DeviceService::GetAllDevices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    return devices_;
}

bool DeviceService::AddDevice(std::string_view name,
                              std::string_view ip_address,
                              long long port,
                              long long timeout_seconds) {
    try {
        Device device(name, ip_address, port, timeout_seconds);

        {
            std::lock_guard<std::mutex> lock(devices_mutex_);
            if (std::ranges::any_of(devices_,
                                    [&](const Device& d) { return d.name() == device.name(); })) {
                spdlog::warn("Device with name \"{}\" already exists", device.name());
                return false;
            }
        }

        bool success = repository_.AddDevice(device);
        reload();
        if (success) {
            spdlog::info("Added device: {} ({}:{})", device.name(), device.ip_address(), device.port());
        }
        return success;
    } catch (const ValidationError& e) {
        spdlog::error("Invalid device data: {}", e.what());
        return false;
    }
}

bool DeviceService::RemoveDevice(std::string_view name) {
    bool success = repository_.RemoveDevice(name);
    reload();
    if (success) {
        spdlog::info("Removed device: {}", name);
    }
    return success;
}

bool DeviceService::CheckDeviceStatus(Device& device) {
    return prober_.CheckDeviceStatus(device);
}

void DeviceService::CheckAllDevices() {
    std::vector<Device> enabled;
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        std::ranges::copy_if(devices_, std::back_inserter(enabled), &Device::enabled);
    }
    spdlog::info("Checking status of {} enabled devices", enabled.size());

    if (!enabled.empty()) {
        auto workers = std::clamp(enabled.size(), probe::kMinCheckWorkers, probe::kMaxCheckWorkers);
        net::thread_pool pool(workers);
        for (auto& device : enabled) {
            net::post(pool, [this, &device]() {
                try {
                    prober_.CheckDeviceStatus(device);
                } catch (const std::exception& e) {
                    spdlog::error("Exception during device check of {}: {}", device.name(), e.what());
                }
            });
        }
        pool.join();
    }

    reload();
}

bool DeviceService::EnableDevice(std::string_view name) {
    return setEnabled(name, true);
}

bool DeviceService::DisableDevice(std::string_view name) {
    return setEnabled(name, false);
}

bool DeviceService::setEnabled(std::string_view name, bool enabled) {
    auto device = repository_.GetDevice(name);
    if (!device) {
        spdlog::warn("Device not found: {}", name);
        return false;
    }
    device->SetEnabled(enabled);
    bool success = repository_.UpdateDevice(*device);
    reload();
    return success;
}

void DeviceService::reload() {
    auto devices = repository_.LoadAll();
    std::lock_guard<std::mutex> lock(devices_mutex_);
    devices_ = std::move(devices);
}

} // namespace devmon::core
