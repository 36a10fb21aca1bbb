#pragma once

#include <core/exception.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace devmon::core {

namespace validator {

constexpr std::size_t kMaxNameLength = 50;
constexpr int kMinTimeoutSeconds = 1;
constexpr int kMaxTimeoutSeconds = 300;

// Each function returns the normalized value or throws ValidationError

// Trimmed, 1-50 characters of [A-Za-z0-9_.-]
std::string ValidateName(std::string_view name);

// Dotted quad, every octet 0-255
std::string ValidateIp(std::string_view ip);

std::uint16_t ValidatePort(long long port);

int ValidateTimeout(long long timeout_seconds);

} // namespace validator

} // namespace devmon::core
