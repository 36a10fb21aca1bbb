#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace devmon::core {

// Opens and immediately closes one TCP connection. Resolution failure, refusal and
// timeout all yield false; nothing is thrown.
bool TcpConnect(const std::string& host, std::uint16_t port, std::chrono::seconds timeout);

} // namespace devmon::core
