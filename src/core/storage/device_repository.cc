#include <algorithm>
#include <core/storage/device_repository.h>
#include <cstdio>
#include <fstream>
#include <spdlog/spdlog.h>

#if defined(_WIN32) || defined(_WIN64)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace devmon::core {

namespace fs = std::filesystem;

DeviceRepository::DeviceRepository(fs::path storage_path)
    : storage_path_(std::move(storage_path)) {
    std::error_code ec;
    if (storage_path_.has_parent_path()) {
        fs::create_directories(storage_path_.parent_path(), ec);
    }
    if (ec) {
        spdlog::error("Failed to create storage directory \"{}\": {}",
                      storage_path_.parent_path().string(),
                      ec.message());
    }
    spdlog::info("DeviceRepository initialized with storage path: {}", storage_path_.string());
}

std::vector<Device> DeviceRepository::LoadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadAll();
}

bool DeviceRepository::SaveAll(const std::vector<Device>& devices) {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveAll(devices);
}

bool DeviceRepository::AddDevice(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto devices = loadAll();
    if (std::ranges::any_of(devices, [&](const Device& d) { return d.name() == device.name(); })) {
        spdlog::warn("Device already stored: {}", device.name());
        return false;
    }
    devices.push_back(device);
    return saveAll(devices);
}

bool DeviceRepository::RemoveDevice(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto devices = loadAll();
    auto removed = std::erase_if(devices, [&](const Device& d) { return d.name() == name; });
    if (removed == 0) {
        spdlog::warn("Device not found: {}", name);
        return false;
    }
    if (!saveAll(devices)) {
        return false;
    }
    spdlog::info("Removed device: {}", name);
    return true;
}

bool DeviceRepository::UpdateDevice(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto devices = loadAll();
    auto it = std::ranges::find_if(devices,
                                   [&](const Device& d) { return d.name() == device.name(); });
    if (it == devices.end()) {
        spdlog::warn("Device not found for update: {}", device.name());
        return false;
    }
    *it = device;
    if (!saveAll(devices)) {
        return false;
    }
    spdlog::debug("Updated device: {}", device.name());
    return true;
}

std::optional<Device> DeviceRepository::GetDevice(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& device : loadAll()) {
        if (device.name() == name) {
            return device;
        }
    }
    return std::nullopt;
}

std::vector<Device> DeviceRepository::loadAll() {
    std::error_code ec;
    if (!fs::exists(storage_path_, ec)) {
        spdlog::info("No devices file found at {}, returning empty list", storage_path_.string());
        return {};
    }

    std::ifstream ifs(storage_path_);
    if (!ifs.is_open()) {
        spdlog::error("Failed to open \"{}\" for reading", storage_path_.string());
        return {};
    }

    try {
        auto data = nlohmann::json::parse(ifs);
        if (!data.is_array()) {
            spdlog::error("Devices file {} does not hold an array", storage_path_.string());
            return {};
        }
        std::vector<Device> devices;
        devices.reserve(data.size());
        for (const auto& record : data) {
            devices.push_back(Device::FromJson(record));
        }
        spdlog::info("Loaded {} devices from storage", devices.size());
        return devices;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Error decoding JSON from {}: {}", storage_path_.string(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error loading devices: {}", e.what());
    }
    return {};
}

bool DeviceRepository::saveAll(const std::vector<Device>& devices) {
    auto tmp_path = tempPath();
    auto discard = [&tmp_path]() {
        std::error_code ec;
        fs::remove(tmp_path, ec);
    };

    nlohmann::json data = nlohmann::json::array();
    for (const auto& device : devices) {
        data.push_back(device.ToJson());
    }
    std::string content = data.dump(2);

    std::FILE* file = std::fopen(tmp_path.string().c_str(), "wb");
    if (file == nullptr) {
        spdlog::error("Failed to open \"{}\" for writing", tmp_path.string());
        return false;
    }
    bool written = std::fwrite(content.data(), 1, content.size(), file) == content.size()
                   && std::fflush(file) == 0;
#if defined(_WIN32) || defined(_WIN64)
    written = written && ::_commit(::_fileno(file)) == 0;
#else
    written = written && ::fsync(::fileno(file)) == 0;
#endif
    written = (std::fclose(file) == 0) && written;
    if (!written) {
        spdlog::error("Error saving devices: failed to write \"{}\"", tmp_path.string());
        discard();
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, storage_path_, ec);
    if (ec) {
        spdlog::error("Error saving devices: rename to \"{}\" failed: {}",
                      storage_path_.string(),
                      ec.message());
        discard();
        return false;
    }
    spdlog::info("Saved {} devices to storage", devices.size());
    return true;
}

fs::path DeviceRepository::tempPath() const {
    auto tmp = storage_path_;
    tmp += ".tmp";
    return tmp;
}

} // namespace devmon::core
