#pragma once

#include <core/model/device.h>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devmon::core {

/**
 * @brief Durable JSON store of the whole device collection.
 *
 * @details The file is an array of device records. Every public operation holds the
 * store lock for its full load-modify-save round trip, so concurrent callers never
 * interleave. Writes go to a sibling temporary file which is flushed to stable storage
 * and then renamed over the destination; readers never see a partial file.
 *
 * No I/O or decode failure escapes as an exception: reads degrade to an empty
 * collection and writes report false.
 */
class DeviceRepository {
public:
    explicit DeviceRepository(std::filesystem::path storage_path);
    DeviceRepository(const DeviceRepository&) = delete;
    DeviceRepository& operator=(const DeviceRepository&) = delete;

    std::vector<Device> LoadAll();
    bool SaveAll(const std::vector<Device>& devices);

    // false if the name is already stored
    bool AddDevice(const Device& device);
    // false if the name is not stored
    bool RemoveDevice(std::string_view name);
    bool UpdateDevice(const Device& device);
    std::optional<Device> GetDevice(std::string_view name);

    const std::filesystem::path& storage_path() const { return storage_path_; }

private:
    std::filesystem::path storage_path_;
    std::mutex mutex_;

    // Callers hold mutex_
    std::vector<Device> loadAll();
    bool saveAll(const std::vector<Device>& devices);

    std::filesystem::path tempPath() const;
};

} // namespace devmon::core
