#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/endian/conversion.hpp>
#include <core/model/feedback.h>
#include <ipc/ipc_service.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace net = boost::asio;

namespace devmon::ipc {

constexpr std::chrono::milliseconds kFeedbackPollInterval{10};

#ifdef _WIN32
static HANDLE openPipe(const std::string& name, DWORD access) {
    std::wstring wide_name(name.begin(), name.end());
    HANDLE handle = CreateFileW(wide_name.c_str(),
                                access,
                                0,
                                NULL,
                                OPEN_EXISTING,
                                FILE_FLAG_OVERLAPPED, // 需要异步I/O
                                NULL);
    if (handle == INVALID_HANDLE_VALUE) {
        DWORD error = GetLastError();
        spdlog::error("Windows: Failed to connect to pipe '{}'. CreateFileW error: {}", name, error);
        throw std::runtime_error("Failed to connect to pipe. Error: " + std::to_string(error));
    }
    return handle;
}
#endif

IpcService::IpcService(net::io_context& io_context,
                       IpcEventStream& event_stream,
                       [[maybe_unused]] const std::string& stdin_pipe_name,
                       [[maybe_unused]] const std::string& stdout_pipe_name)
    : io_context_(io_context)
    , event_stream_(event_stream)
#ifdef _WIN32
    , input_(io_context, openPipe(stdin_pipe_name, GENERIC_READ))
    , output_(io_context, openPipe(stdout_pipe_name, GENERIC_WRITE))
#else
    , input_(io_context, ::dup(STDIN_FILENO))
    , output_(io_context, ::dup(STDOUT_FILENO))
#endif
{
}

void IpcService::Start() {
    if (running_) {
        return;
    }
    running_ = true;
    spdlog::info("Pipe communication started");

    auto on_exit = [](std::exception_ptr e) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("Pipe communication exception: {}", ex.what());
            }
        }
    };
    net::co_spawn(io_context_, readMessageLoop(), on_exit);
    net::co_spawn(io_context_, readEventStreamLoop(), on_exit);
}

void IpcService::Stop() {
    running_ = false;
    boost::system::error_code ec;
    input_.close(ec);
}

std::string IpcService::EncodeFrame(const nlohmann::json& message) {
    std::string body = message.dump();
    std::uint32_t length_be = boost::endian::native_to_big(static_cast<std::uint32_t>(body.size()));
    std::string frame(reinterpret_cast<const char*>(&length_be), sizeof(length_be));
    frame += body;
    return frame;
}

std::optional<Operation> IpcService::DecodeOperation(const std::string& message_str) {
    try {
        auto message = nlohmann::json::parse(message_str);
        if (!message.is_object() || !message.contains("operation")
            || !message["operation"].is_string()) {
            spdlog::error("Invalid message format: missing operation field");
            return std::nullopt;
        }
        Operation operation{
            .type = message["operation"].get<OperationType>(),
            .data = message.value("data", nlohmann::json::object()),
        };
        if (operation.type == OperationType::kUnknown) {
            spdlog::error("Unknown operation: {}", message["operation"].get<std::string>());
            return std::nullopt;
        }
        return operation;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to process message: {}", e.what());
        return std::nullopt;
    }
}

net::awaitable<void> IpcService::sendMessage(const nlohmann::json& message) {
    auto frame = EncodeFrame(message);
    boost::system::error_code ec;
    co_await net::async_write(output_, net::buffer(frame), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        spdlog::error("Failed to send message: {}", ec.message());
    }
}

net::awaitable<void> IpcService::readMessageLoop() {
    spdlog::info("Starting read message loop");
    std::uint32_t length_be = 0;
    std::string message_buffer;

    while (running_) {
        boost::system::error_code ec;
        co_await net::async_read(input_,
                                 net::buffer(&length_be, sizeof(length_be)),
                                 net::redirect_error(net::use_awaitable, ec));
        if (!ec) {
            auto length = boost::endian::big_to_native(length_be);
            if (length > kMaxFrameSize) {
                // The stream cannot be resynchronized after an oversized header
                spdlog::error("Message too large: {} bytes", length);
                break;
            }
            message_buffer.resize(length);
            co_await net::async_read(input_,
                                     net::buffer(message_buffer),
                                     net::redirect_error(net::use_awaitable, ec));
        }
        if (ec) {
            if (ec != net::error::operation_aborted) {
                spdlog::info("Pipe closed ({}), exiting read loop", ec.message());
            }
            break;
        }
        if (auto operation = DecodeOperation(message_buffer); operation) {
            event_stream_.PostOperation(std::move(*operation));
        }
    }

    // Without a front-end there is nobody to serve
    if (running_) {
        running_ = false;
        event_stream_.PostOperation(Operation{
            .type = OperationType::kExitApp,
            .data = nlohmann::json::object(),
        });
    }
    spdlog::info("Exiting read message loop");
}

net::awaitable<void> IpcService::readEventStreamLoop() {
    spdlog::info("Starting read event stream loop");

    // Named local: GCC 12 rejects a braced temporary inside co_await
    const nlohmann::json started = {
        {"feedback", core::FeedbackType::kBackendStarted},
        {"data", core::feedback::BackendStarted::Current()},
        {"timestamp", std::chrono::system_clock::now().time_since_epoch().count()},
    };
    co_await sendMessage(started);

    net::steady_timer idle(co_await net::this_coro::executor);
    while (running_) {
        auto feedback = event_stream_.PollFeedback();
        if (!feedback) {
            idle.expires_after(kFeedbackPollInterval);
            co_await idle.async_wait(net::use_awaitable);
            continue;
        }
        spdlog::debug("Processing feedback: {}", nlohmann::json(feedback->type).get<std::string>());
        const nlohmann::json message = {
            {"feedback", feedback->type},
            {"data", feedback->data},
            {"timestamp", std::chrono::system_clock::now().time_since_epoch().count()},
        };
        co_await sendMessage(message);
    }
    spdlog::info("Exiting read event stream loop");
}

} // namespace devmon::ipc
