#pragma once

#include "ipc_event_stream.h"
#include "model.h"
#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <core/model/device.h>
#include <core/network/prober/reachability_prober.h>
#include <core/service/device_service.h>
#include <core/service/scheduler_service.h>
#include <core/storage/device_repository.h>
#include <functional>
#include <string>
#include <vector>

namespace devmon::ipc {

struct BackendOptions {
    core::ProbeOptions probe;
    bool auto_check;
    std::chrono::seconds check_interval;

    static BackendOptions FromConfigSettings();
};

/**
 * @brief Backend of the IPC bridge
 *
 * @details Polls operations from IpcEventStream, dispatches them and posts feedback back
 * to the stream. Every handler can also be called directly; its return value is the
 * result of the operation.
 *
 * Owns:
 * - the device service, with probing and the concurrent full check
 * - the background scheduler, which runs the auto-check task
 *
 * A dispatched CheckAllDevices runs on a separate worker, one at a time, so the operation
 * loop keeps serving other requests from the cached device list meanwhile.
 *
 * @note Not copyable or assignable.
 */
class IpcBackendService {
public:
    IpcBackendService(boost::asio::io_context& ioc,
                      IpcEventStream& event_stream,
                      core::DeviceRepository& repository,
                      BackendOptions options = BackendOptions::FromConfigSettings());
    ~IpcBackendService();
    IpcBackendService(const IpcBackendService&) = delete;
    IpcBackendService& operator=(const IpcBackendService&) = delete;

    // Starts the operation loop and the scheduler, then the auto-check task if enabled
    void Start();
    // Stops the loop and the scheduler; scheduled tasks are joined with a bounded wait
    void Stop();

    void SetExitAppCallback(std::function<void()>&& callback);

    // Handles one operation polled from the front-end
    void DispatchOperation(const Operation& operation);

    bool AddDevice(const operation::AddDevice& add_device);
    bool RemoveDevice(const std::string& name);
    // Blocks until every enabled device has been probed
    void CheckAllDevices();
    std::vector<core::Device> GetDevices();
    bool SetDeviceEnabled(const operation::SetDeviceEnabled& set_enabled);

    core::DeviceService& device_service() { return device_service_; }
    core::SchedulerService& scheduler_service() { return scheduler_service_; }

private:
    boost::asio::io_context& ioc_;
    IpcEventStream& event_stream_;
    BackendOptions options_;
    core::DeviceService device_service_;
    core::SchedulerService scheduler_service_;
    std::function<void()> exit_app_callback_ = nullptr;
    std::atomic<bool> is_running_{false};
    std::atomic<bool> is_checking_{false};
    // Declared last: destroyed first, waiting for a running check while the services live
    boost::asio::thread_pool check_pool_{1};

    // Operation polling loop
    boost::asio::awaitable<void> start();

    void checkAllDevicesInBackground();

    void exitApp();

    void feedback(core::Feedback&& feedback) { event_stream_.PostFeedback(std::move(feedback)); }
};

} // namespace devmon::ipc
