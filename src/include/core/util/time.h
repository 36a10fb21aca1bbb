#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace devmon::core {

namespace time {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

// Current time truncated to the precision kept on disk
TimePoint Now();

// ISO 8601 in UTC, e.g. 2026-10-18T21:04:05.123456Z
std::string ToIsoString(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff][Z]"; a missing zone is read as UTC
std::optional<TimePoint> FromIsoString(std::string_view text);

} // namespace time

} // namespace devmon::core
