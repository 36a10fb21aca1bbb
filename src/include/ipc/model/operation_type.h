#pragma once

#include <nlohmann/json.hpp>

namespace devmon::ipc {

enum class OperationType {
    kUnknown,          // 无法识别的操作名
    kAddDevice,        // 添加设备，提供name, ip_address, 可选port和timeout
    kRemoveDevice,     // 删除设备，提供name
    kCheckAllDevices,  // 检查所有已启用设备，不用提供数据
    kGetDevices,       // 获取设备列表，不用提供数据
    kSetDeviceEnabled, // 启用或停用设备，提供name和enabled
    kExitApp,          // 要求退出应用
};

// Unrecognized names decode to the first entry, kUnknown
NLOHMANN_JSON_SERIALIZE_ENUM(OperationType,
                             {
                                 {OperationType::kUnknown, nullptr},
                                 {OperationType::kAddDevice, "AddDevice"},
                                 {OperationType::kRemoveDevice, "RemoveDevice"},
                                 {OperationType::kCheckAllDevices, "CheckAllDevices"},
                                 {OperationType::kGetDevices, "GetDevices"},
                                 {OperationType::kSetDeviceEnabled, "SetDeviceEnabled"},
                                 {OperationType::kExitApp, "ExitApp"},
                             });

} // namespace devmon::ipc
