#include <boost/process.hpp>
#include <core/util/system.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace bp = boost::process;

namespace devmon::core {

namespace system {

// Slack on top of ping's own deadline before the child is killed
constexpr std::chrono::seconds kPingGrace{1};

std::vector<std::string> PingArguments(const std::string& host, std::chrono::seconds timeout) {
#if defined(_WIN32) || defined(_WIN64)
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
    return {"-n", "1", "-w", std::to_string(millis), host};
#elif defined(__APPLE__) || defined(__MACH__) || defined(__FreeBSD__)
    return {"-c", "1", "-t", std::to_string(timeout.count()), host};
#else
    return {"-c", "1", "-W", std::to_string(timeout.count()), host};
#endif
}

bool Ping(const std::string& host, std::chrono::seconds timeout) {
    auto executable = bp::search_path("ping");
    if (executable.empty()) {
        spdlog::warn("ping executable not found in PATH");
        return false;
    }

    std::error_code ec;
    bp::child child(executable,
                    bp::args(PingArguments(host, timeout)),
                    bp::std_in < bp::null,
                    bp::std_out > bp::null,
                    bp::std_err > bp::null,
                    ec);
    if (ec) {
        spdlog::error("Failed to launch ping for {}: {}", host, ec.message());
        return false;
    }

    if (!child.wait_for(timeout + kPingGrace, ec)) {
        spdlog::debug("ping {} did not finish in time, terminating", host);
        child.terminate(ec);
        return false;
    }
    if (ec) {
        spdlog::error("Waiting for ping {} failed: {}", host, ec.message());
        return false;
    }
    return child.exit_code() == 0;
}

} // namespace system

} // namespace devmon::core
