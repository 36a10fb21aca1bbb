#pragma once

#include <stdexcept>
#include <string>

namespace devmon::core {

// Raised for malformed user input; the message names the violated rule
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace devmon::core
