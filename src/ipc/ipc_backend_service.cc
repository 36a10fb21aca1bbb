#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/constant/probe.h>
#include <core/model/feedback.h>
#include <core/util/config.h>
#include <ipc/ipc_backend_service.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace devmon::ipc {

// Idle wait of the operation loop when the stream is empty
constexpr std::chrono::milliseconds kPollInterval{10};

// Name field of a rejected payload, empty when absent or not a string
static std::string nameOf(const nlohmann::json& data) {
    if (data.is_object() && data.contains("name") && data["name"].is_string()) {
        return data["name"].get<std::string>();
    }
    return "";
}

BackendOptions BackendOptions::FromConfigSettings() {
    return BackendOptions{
        .probe = core::ProbeOptions::FromConfigSettings(),
        .auto_check = core::settings.auto_check,
        .check_interval = core::settings.check_interval,
    };
}

IpcBackendService::IpcBackendService(net::io_context& ioc,
                                     IpcEventStream& event_stream,
                                     core::DeviceRepository& repository,
                                     BackendOptions options)
    : ioc_(ioc)
    , event_stream_(event_stream)
    , options_(std::move(options))
    , device_service_(repository, options_.probe) {}

IpcBackendService::~IpcBackendService() {
    Stop();
}

void IpcBackendService::Start() {
    if (is_running_) {
        return;
    }
    is_running_ = true;
    net::co_spawn(ioc_, start(), net::detached);

    scheduler_service_.Start();
    if (options_.auto_check) {
        scheduler_service_.ScheduleRepeating(
            core::schedule::kAutoCheckTaskName,
            [this]() {
                event_stream_.PostOperation(Operation{
                    .type = OperationType::kCheckAllDevices,
                    .data = nlohmann::json::object(),
                });
            },
            options_.check_interval);
    }
    spdlog::debug("IpcBackendService started");
}

void IpcBackendService::Stop() {
    is_running_ = false;
    scheduler_service_.Stop();
    spdlog::debug("IpcBackendService stopped");
}

void IpcBackendService::SetExitAppCallback(std::function<void()>&& callback) {
    exit_app_callback_ = std::move(callback);
}

net::awaitable<void> IpcBackendService::start() {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer idle(executor);
    while (is_running_) {
        if (auto operation = event_stream_.PollOperation(); operation) {
            try {
                DispatchOperation(*operation);
            } catch (const std::exception& e) {
                spdlog::error("IPC Error: failed to handle operation: {}", e.what());
            }
        } else {
            idle.expires_after(kPollInterval);
            co_await idle.async_wait(net::use_awaitable);
        }
    }
}

void IpcBackendService::DispatchOperation(const Operation& operation) {
    switch (operation.type) {
    case OperationType::kAddDevice: {
        spdlog::debug("IpcBackendService: dispatch operation \"AddDevice\"");
        if (auto data = operation.getData<operation::AddDevice>(); data) {
            AddDevice(*data);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"AddDevice\"");
            feedback(core::Feedback{
                .type = core::FeedbackType::kDeviceAddFailed,
                .data = core::feedback::DeviceName{.name = nameOf(operation.data)},
            });
        }
        break;
    }
    case OperationType::kRemoveDevice: {
        spdlog::debug("IpcBackendService: dispatch operation \"RemoveDevice\"");
        if (auto data = operation.getData<operation::RemoveDevice>(); data) {
            RemoveDevice(data->name);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"RemoveDevice\"");
        }
        break;
    }
    case OperationType::kCheckAllDevices: {
        spdlog::debug("IpcBackendService: dispatch operation \"CheckAllDevices\"");
        checkAllDevicesInBackground();
        break;
    }
    case OperationType::kGetDevices: {
        spdlog::debug("IpcBackendService: dispatch operation \"GetDevices\"");
        feedback(core::Feedback{
            .type = core::FeedbackType::kDeviceList,
            .data = core::feedback::DeviceList{.devices = GetDevices()},
        });
        break;
    }
    case OperationType::kSetDeviceEnabled: {
        spdlog::debug("IpcBackendService: dispatch operation \"SetDeviceEnabled\"");
        if (auto data = operation.getData<operation::SetDeviceEnabled>(); data) {
            SetDeviceEnabled(*data);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"SetDeviceEnabled\"");
        }
        break;
    }
    case OperationType::kExitApp: {
        exitApp();
        break;
    }
    case OperationType::kUnknown: {
        spdlog::error("IPC Error: unknown operation");
        break;
    }
    }
}

bool IpcBackendService::AddDevice(const operation::AddDevice& add_device) {
    bool result = device_service_.AddDevice(add_device.name,
                                            add_device.ip_address,
                                            add_device.port,
                                            add_device.timeout);
    feedback(core::Feedback{
        .type = result ? core::FeedbackType::kDeviceAdded : core::FeedbackType::kDeviceAddFailed,
        .data = core::feedback::DeviceName{.name = add_device.name},
    });
    return result;
}

bool IpcBackendService::RemoveDevice(const std::string& name) {
    bool result = device_service_.RemoveDevice(name);
    feedback(core::Feedback{
        .type = result ? core::FeedbackType::kDeviceRemoved : core::FeedbackType::kDeviceRemoveFailed,
        .data = core::feedback::DeviceName{.name = name},
    });
    return result;
}

void IpcBackendService::CheckAllDevices() {
    device_service_.CheckAllDevices();
    feedback(core::Feedback{
        .type = core::FeedbackType::kDevicesChecked,
        .data = core::feedback::DeviceList{.devices = device_service_.GetAllDevices()},
    });
}

std::vector<core::Device> IpcBackendService::GetDevices() {
    return device_service_.GetAllDevices();
}

bool IpcBackendService::SetDeviceEnabled(const operation::SetDeviceEnabled& set_enabled) {
    bool result = set_enabled.enabled ? device_service_.EnableDevice(set_enabled.name)
                                      : device_service_.DisableDevice(set_enabled.name);
    if (result) {
        feedback(core::Feedback{
            .type = core::FeedbackType::kDeviceEnabledChanged,
            .data = core::feedback::DeviceEnabledChanged{.name = set_enabled.name,
                                                         .enabled = set_enabled.enabled},
        });
    } else {
        feedback(core::Feedback{
            .type = core::FeedbackType::kDeviceEnableFailed,
            .data = core::feedback::DeviceName{.name = set_enabled.name},
        });
    }
    return result;
}

void IpcBackendService::checkAllDevicesInBackground() {
    if (is_checking_.exchange(true)) {
        spdlog::info("A device check is already running, request ignored");
        return;
    }
    net::post(check_pool_, [this]() {
        try {
            CheckAllDevices();
        } catch (const std::exception& e) {
            spdlog::error("Device check failed: {}", e.what());
        }
        is_checking_ = false;
    });
}

void IpcBackendService::exitApp() {
    Stop();
    ioc_.stop();
    if (exit_app_callback_) {
        exit_app_callback_();
    }
}

} // namespace devmon::ipc
