#include <mcp_gateway/core/clock.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_gateway {

namespace {

bool ParseDigits(std::string_view text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // anonymous namespace

IClock& DefaultClock() {
    static SystemClock clock;
    return clock;
}

std::string FormatIso8601(TimePoint tp) {
    const auto time_t_value = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
    }

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time_t_value);
#else
    gmtime_r(&time_t_value, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::optional<TimePoint> ParseIso8601(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS = 19 chars
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }

    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!ParseDigits(text, 0, 4, year) || !ParseDigits(text, 5, 2, month) ||
        !ParseDigits(text, 8, 2, day) || !ParseDigits(text, 11, 2, hour) ||
        !ParseDigits(text, 14, 2, minute) || !ParseDigits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60) {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    // Fractional seconds: keep millisecond precision, ignore the rest.
    std::chrono::milliseconds fraction{0};
    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        int value = 0;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                value = value * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 3; ++i) value *= 10;
        fraction = std::chrono::milliseconds(value);
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

#ifdef _WIN32
    const auto seconds = _mkgmtime(&tm);
#else
    const auto seconds = timegm(&tm);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(seconds) +
           std::chrono::duration_cast<Clock::duration>(fraction);
}

} // namespace mcp_gateway
