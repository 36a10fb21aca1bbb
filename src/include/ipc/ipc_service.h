#pragma once

#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <ipc/ipc_event_stream.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#ifdef _WIN32
#include <boost/asio/windows/stream_handle.hpp>
#else
#include <boost/asio/posix/stream_descriptor.hpp>
#endif

namespace devmon::ipc {

// receive operations from the front-end application, post them to IpcEventStream
// poll feedback from IpcEventStream, send it to the front-end application
//
// Every frame is a 4-byte big-endian length followed by that many bytes of JSON:
//   in:  {"operation": "<OperationType>", "data": {...}}
//   out: {"feedback": "<FeedbackType>", "data": {...}, "timestamp": <ns since epoch>}
class IpcService {
public:
    static constexpr std::uint32_t kMaxFrameSize = 10 * 1024 * 1024;

    // The pipe names are only used on Windows; elsewhere stdin and stdout are used
    IpcService(boost::asio::io_context& io_context,
               IpcEventStream& event_stream,
               const std::string& stdin_pipe_name,
               const std::string& stdout_pipe_name);

    // 启动管道通信
    void Start();
    void Stop();

    // Decodes one inbound frame body; malformed input is logged and yields nullopt
    static std::optional<Operation> DecodeOperation(const std::string& message_str);

    static std::string EncodeFrame(const nlohmann::json& message);

private:
    boost::asio::io_context& io_context_;
    IpcEventStream& event_stream_;
#ifdef _WIN32
    boost::asio::windows::stream_handle input_;
    boost::asio::windows::stream_handle output_;
#else
    boost::asio::posix::stream_descriptor input_;
    boost::asio::posix::stream_descriptor output_;
#endif
    bool running_{false};

    // 处理从标准输入读取的消息
    boost::asio::awaitable<void> readMessageLoop();

    // 处理从event_stream读取的反馈
    boost::asio::awaitable<void> readEventStreamLoop();

    boost::asio::awaitable<void> sendMessage(const nlohmann::json& message);
};

} // namespace devmon::ipc
