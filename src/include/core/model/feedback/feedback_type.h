#pragma once

#include <nlohmann/json.hpp>

namespace devmon::core {

enum class FeedbackType {
    kBackendStarted,       // 后端已启动（版本和平台）
    kDeviceAdded,          // 设备添加成功（设备名）
    kDeviceAddFailed,      // 设备添加失败：输入非法、重名或写入失败（设备名）
    kDeviceRemoved,        // 设备已删除（设备名）
    kDeviceRemoveFailed,   // 删除失败，设备不存在（设备名）
    kDevicesChecked,       // 全部检查结束（完整设备列表）
    kDeviceList,           // 对GetDevices的回复（完整设备列表）
    kDeviceEnabledChanged, // 设备启用状态已修改（设备名，是否启用）
    kDeviceEnableFailed,   // 启用状态修改失败（设备名）
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kBackendStarted, "BackendStarted"},
                                 {FeedbackType::kDeviceAdded, "DeviceAdded"},
                                 {FeedbackType::kDeviceAddFailed, "DeviceAddFailed"},
                                 {FeedbackType::kDeviceRemoved, "DeviceRemoved"},
                                 {FeedbackType::kDeviceRemoveFailed, "DeviceRemoveFailed"},
                                 {FeedbackType::kDevicesChecked, "DevicesChecked"},
                                 {FeedbackType::kDeviceList, "DeviceList"},
                                 {FeedbackType::kDeviceEnabledChanged, "DeviceEnabledChanged"},
                                 {FeedbackType::kDeviceEnableFailed, "DeviceEnableFailed"},
                             });

} // namespace devmon::core
