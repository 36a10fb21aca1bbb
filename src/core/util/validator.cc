#include <charconv>
#include <core/util/validator.h>
#include <regex>
#include <spdlog/fmt/fmt.h>

namespace devmon::core {

namespace validator {

static std::string_view trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string ValidateName(std::string_view name) {
    static const std::regex kNamePattern("^[A-Za-z0-9_.-]+$");

    auto trimmed = trim(name);
    if (trimmed.empty()) {
        throw ValidationError("Device name cannot be empty");
    }
    if (trimmed.size() > kMaxNameLength) {
        throw ValidationError(
            fmt::format("Device name cannot exceed {} characters", kMaxNameLength));
    }
    std::string result(trimmed);
    if (!std::regex_match(result, kNamePattern)) {
        throw ValidationError("Device name contains invalid characters");
    }
    return result;
}

std::string ValidateIp(std::string_view ip) {
    static const std::regex kIpPattern(R"(^(\d{1,3}\.){3}\d{1,3}$)");

    auto trimmed = trim(ip);
    if (trimmed.empty()) {
        throw ValidationError("IP address cannot be empty");
    }
    std::string result(trimmed);
    if (!std::regex_match(result, kIpPattern)) {
        throw ValidationError(fmt::format("Invalid IP address format: {}", result));
    }

    std::string_view rest = result;
    while (!rest.empty()) {
        auto dot = rest.find('.');
        auto octet_text = rest.substr(0, dot);
        int octet = -1;
        std::from_chars(octet_text.data(), octet_text.data() + octet_text.size(), octet);
        if (octet < 0 || octet > 255) {
            throw ValidationError("IP octets must be between 0 and 255");
        }
        rest = dot == std::string_view::npos ? std::string_view{} : rest.substr(dot + 1);
    }
    return result;
}

std::uint16_t ValidatePort(long long port) {
    if (port < 1 || port > 65535) {
        throw ValidationError(fmt::format("Port must be between 1 and 65535, got {}", port));
    }
    return static_cast<std::uint16_t>(port);
}

int ValidateTimeout(long long timeout_seconds) {
    if (timeout_seconds < kMinTimeoutSeconds) {
        throw ValidationError(
            fmt::format("Timeout must be at least {} second, got {}", kMinTimeoutSeconds, timeout_seconds));
    }
    if (timeout_seconds > kMaxTimeoutSeconds) {
        throw ValidationError(fmt::format("Timeout cannot exceed {} seconds, got {}",
                                          kMaxTimeoutSeconds,
                                          timeout_seconds));
    }
    return static_cast<int>(timeout_seconds);
}

} // namespace validator

} // namespace devmon::core
