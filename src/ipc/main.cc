#include <boost/asio/io_context.hpp>
#include <core/constant/path.h>
#include <core/storage/device_repository.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <ipc/ipc_backend_service.h>
#include <ipc/ipc_event_stream.h>
#include <ipc/ipc_service.h>
#include <string>

using namespace devmon;
using namespace devmon::core;
namespace net = boost::asio;

int main(int argc, char* argv[]) {
    bool debug = false;
    // 命名管道名称，仅Windows使用
    std::string stdin_pipe_name;
    std::string stdout_pipe_name;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--debug") {
            debug = true;
        } else if (arg == "--stdin-pipe-name" && i + 1 < argc) {
            stdin_pipe_name = argv[++i];
        } else if (arg == "--stdout-pipe-name" && i + 1 < argc) {
            stdout_pipe_name = argv[++i];
        }
    }

    Logger logger(debug ? Logger::Level::debug : Logger::ResolveLevel("info"), path::kLogDir);
    InitConfig();
    if (!debug) {
        logger.set_log_level(Logger::ResolveLevel(settings.log_level));
    }

    try {
        net::io_context ioc;
        DeviceRepository repository(settings.devices_file);
        ipc::IpcEventStream event_stream;
        ipc::IpcService ipc_service(ioc, event_stream, stdin_pipe_name, stdout_pipe_name);
        ipc::IpcBackendService backend_service(ioc, event_stream, repository);
        backend_service.SetExitAppCallback([&ipc_service]() { ipc_service.Stop(); });

        spdlog::info("devmon backend started");

        ipc_service.Start();     // communication with the front-end
        backend_service.Start(); // core service

        ioc.run();

        backend_service.Stop();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to start application: {}", e.what());
        SaveConfig();
        return 1;
    }

    SaveConfig();
    spdlog::info("devmon backend exited");
    return 0;
}
