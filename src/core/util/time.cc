#include <cctype>
#include <charconv>
#include <core/util/time.h>
#include <spdlog/fmt/fmt.h>

namespace devmon::core {

namespace time {

using namespace std::chrono;

TimePoint Now() {
    return floor<microseconds>(Clock::now());
}

std::string ToIsoString(TimePoint tp) {
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss hms{tp - day};
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count(),
                       hms.subseconds().count());
}

static bool readNumber(std::string_view& text, std::size_t digits, int& out) {
    if (text.size() < digits) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + digits, out);
    if (ec != std::errc() || ptr != text.data() + digits) {
        return false;
    }
    text.remove_prefix(digits);
    return true;
}

static bool expect(std::string_view& text, char c) {
    if (text.empty() || text.front() != c) {
        return false;
    }
    text.remove_prefix(1);
    return true;
}

std::optional<TimePoint> FromIsoString(std::string_view text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!readNumber(text, 4, y) || !expect(text, '-') || !readNumber(text, 2, mo)
        || !expect(text, '-') || !readNumber(text, 2, d) || !expect(text, 'T')
        || !readNumber(text, 2, h) || !expect(text, ':') || !readNumber(text, 2, mi)
        || !expect(text, ':') || !readNumber(text, 2, s)) {
        return std::nullopt;
    }

    long micros = 0;
    if (expect(text, '.')) {
        int scale = 100000;
        std::size_t consumed = 0;
        while (consumed < text.size() && std::isdigit(static_cast<unsigned char>(text[consumed]))) {
            if (scale > 0) {
                micros += (text[consumed] - '0') * scale;
                scale /= 10;
            }
            ++consumed;
        }
        if (consumed == 0) {
            return std::nullopt;
        }
        text.remove_prefix(consumed);
    }
    expect(text, 'Z');
    if (!text.empty()) {
        return std::nullopt;
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
        return std::nullopt;
    }
    return TimePoint{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s} + microseconds{micros};
}

} // namespace time

} // namespace devmon::core
