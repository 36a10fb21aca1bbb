#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/network/prober/tcp_connector.h>
#include <optional>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace devmon::core {

bool TcpConnect(const std::string& host, std::uint16_t port, std::chrono::seconds timeout) {
    net::io_context ioc;
    boost::system::error_code ec;

    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        spdlog::debug("Resolution failed for {}: {}", host, ec.message());
        return false;
    }

    tcp::socket socket(ioc);
    net::steady_timer deadline(ioc, timeout);
    std::optional<boost::system::error_code> result;

    net::async_connect(socket,
                       endpoints,
                       [&](const boost::system::error_code& error, const tcp::endpoint&) {
                           result = error;
                           deadline.cancel();
                       });
    deadline.async_wait([&](const boost::system::error_code& error) {
        if (!error && !result) {
            boost::system::error_code ignored;
            socket.close(ignored);
        }
    });
    ioc.run();

    if (!result || *result) {
        spdlog::debug("TCP connect to {}:{} failed: {}",
                      host,
                      port,
                      result ? result->message() : std::string("timed out"));
        return false;
    }
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    return true;
}

} // namespace devmon::core
