#include "hsync/core/date.hpp"

#include <cstdio>

namespace hsync {
namespace {

// Howard Hinnant's civil calendar conversions (proleptic Gregorian).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

Civil civil_from_days(std::int64_t z) noexcept {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Civil{y + (m <= 2 ? 1 : 0), m, d};
}

bool is_leap(std::int64_t y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned last_day_of_month(std::int64_t y, unsigned m) noexcept {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : kDays[m - 1];
}

bool read_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) noexcept {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

constexpr std::int64_t kSecondsPerDay = 86400;

} // namespace

Date Date::from_days(std::int64_t days_since_epoch) noexcept {
    return Date(days_since_epoch);
}

std::optional<Date> Date::from_ymd(int year, unsigned month, unsigned day) noexcept {
    if (month < 1 || month > 12 || day < 1 || day > last_day_of_month(year, month)) {
        return std::nullopt;
    }
    return Date(days_from_civil(year, month, day));
}

std::optional<Date> Date::parse(std::string_view text) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int y = 0;
    int m = 0;
    int d = 0;
    if (!read_digits(text, 0, 4, y) || !read_digits(text, 5, 2, m) || !read_digits(text, 8, 2, d)) {
        return std::nullopt;
    }
    return from_ymd(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

Date Date::from_timestamp_utc(Timestamp ts) noexcept {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    std::int64_t days = secs / kSecondsPerDay;
    if (secs % kSecondsPerDay < 0) {
        --days;
    }
    return Date(days);
}

int Date::year() const noexcept {
    return static_cast<int>(civil_from_days(days_).year);
}

unsigned Date::month() const noexcept {
    return civil_from_days(days_).month;
}

unsigned Date::day() const noexcept {
    return civil_from_days(days_).day;
}

unsigned Date::weekday() const noexcept {
    // 1970-01-01 was a Thursday
    return static_cast<unsigned>(((days_ + 4) % 7 + 7) % 7);
}

Timestamp Date::to_timestamp_utc() const noexcept {
    return Timestamp(std::chrono::seconds(days_ * kSecondsPerDay));
}

std::string Date::to_string() const {
    const auto c = civil_from_days(days_);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u",
                  static_cast<long long>(c.year), c.month, c.day);
    return buffer;
}

std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept {
    if (text.size() == 10) {
        auto date = Date::parse(text);
        if (!date) {
            return std::nullopt;
        }
        return date->to_timestamp_utc();
    }
    if (text.size() != 19 || text[10] != ' ' || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    auto date = Date::parse(text.substr(0, 10));
    int hh = 0;
    int mm = 0;
    int ss = 0;
    if (!date || !read_digits(text, 11, 2, hh) || !read_digits(text, 14, 2, mm) ||
        !read_digits(text, 17, 2, ss)) {
        return std::nullopt;
    }
    if (hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }
    return date->to_timestamp_utc() + std::chrono::hours(hh) + std::chrono::minutes(mm) +
           std::chrono::seconds(ss);
}

std::string format_timestamp(Timestamp ts) {
    const auto date = Date::from_timestamp_utc(ts);
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        ts - date.to_timestamp_utc()).count();
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s %02lld:%02lld:%02lld",
                  date.to_string().c_str(),
                  static_cast<long long>(secs / 3600),
                  static_cast<long long>((secs % 3600) / 60),
                  static_cast<long long>(secs % 60));
    return buffer;
}

std::int64_t to_unix_millis(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_unix_millis(std::int64_t millis) noexcept {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

} // namespace hsync
