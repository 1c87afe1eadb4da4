#include "time.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "exception/exception.hpp"

namespace tessera::tools {

namespace {

int parseField(std::string_view text, size_t offset, size_t width) {
    int value = 0;
    const char* first = text.data() + offset;
    const char* last = first + width;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        THROW_INVALID_PARAMETER("Malformed timestamp: ", std::string(text));
    }
    return value;
}

void expectChar(std::string_view text, size_t offset, std::string_view accepted) {
    if (accepted.find(text[offset]) == std::string_view::npos) {
        THROW_INVALID_PARAMETER("Malformed timestamp: ", std::string(text));
    }
}

}  // namespace

std::string formatIsoTime(const TimePoint& time) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(time);
    const std::time_t tt =
        static_cast<std::time_t>(seconds.time_since_epoch().count());
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

TimePoint parseIsoTime(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS
    constexpr size_t BASE_LENGTH = 19;
    if (text.size() < BASE_LENGTH) {
        THROW_INVALID_PARAMETER("Malformed timestamp: ", std::string(text));
    }
    expectChar(text, 4, "-");
    expectChar(text, 7, "-");
    expectChar(text, 10, "T ");
    expectChar(text, 13, ":");
    expectChar(text, 16, ":");

    const int yearValue = parseField(text, 0, 4);
    const int monthValue = parseField(text, 5, 2);
    const int dayValue = parseField(text, 8, 2);
    const int hour = parseField(text, 11, 2);
    const int minute = parseField(text, 14, 2);
    const int second = parseField(text, 17, 2);

    const std::chrono::year_month_day date{
        std::chrono::year{yearValue},
        std::chrono::month{static_cast<unsigned>(monthValue)},
        std::chrono::day{static_cast<unsigned>(dayValue)}};
    if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
        THROW_INVALID_PARAMETER("Timestamp out of range: ", std::string(text));
    }

    std::chrono::nanoseconds fraction{0};
    size_t pos = BASE_LENGTH;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t scale = 100000000;
        const size_t digitsStart = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            fraction += std::chrono::nanoseconds((text[pos] - '0') * scale);
            scale /= 10;
            ++pos;
        }
        if (pos == digitsStart) {
            THROW_INVALID_PARAMETER("Malformed timestamp: ", std::string(text));
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        THROW_INVALID_PARAMETER("Trailing characters in timestamp: ",
                                std::string(text));
    }

    TimePoint result{std::chrono::sys_days{date}};
    result += std::chrono::hours(hour) + std::chrono::minutes(minute) +
              std::chrono::seconds(second) + fraction;
    return result;
}

TimePoint truncateToSeconds(const TimePoint& time) noexcept {
    return std::chrono::floor<std::chrono::seconds>(time);
}

}  // namespace tessera::tools
