#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace devmon::core {

namespace system {

// Arguments for one echo request with a bounded wait, spelled for this platform's ping
std::vector<std::string> PingArguments(const std::string& host, std::chrono::seconds timeout);

// Runs the system ping once; true only if it exits with status 0 within the timeout
bool Ping(const std::string& host, std::chrono::seconds timeout);

} // namespace system

} // namespace devmon::core
