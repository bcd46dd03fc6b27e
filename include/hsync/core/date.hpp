#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hsync {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Calendar day without time-of-day or timezone
 *
 * Stored as a day count relative to 1970-01-01 so that day walks and
 * differences are plain integer arithmetic. The legacy schema keys every
 * history map by "yyyy-MM-dd"; parse() accepts exactly that shape.
 */
class Date {
public:
    Date() = default;

    static Date from_days(std::int64_t days_since_epoch) noexcept;
    static std::optional<Date> from_ymd(int year, unsigned month, unsigned day) noexcept;

    /// Strict "yyyy-MM-dd" parse, rejecting impossible calendar days
    static std::optional<Date> parse(std::string_view text) noexcept;

    /// Calendar day of a UTC instant
    static Date from_timestamp_utc(Timestamp ts) noexcept;

    [[nodiscard]] std::int64_t days_since_epoch() const noexcept { return days_; }
    [[nodiscard]] int year() const noexcept;
    [[nodiscard]] unsigned month() const noexcept;
    [[nodiscard]] unsigned day() const noexcept;

    /// 0 = Sunday ... 6 = Saturday
    [[nodiscard]] unsigned weekday() const noexcept;

    [[nodiscard]] Date add_days(std::int64_t n) const noexcept { return from_days(days_ + n); }
    [[nodiscard]] std::int64_t days_until(Date other) const noexcept { return other.days_ - days_; }

    /// Midnight UTC of this day
    [[nodiscard]] Timestamp to_timestamp_utc() const noexcept;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(Date a, Date b) noexcept { return a.days_ == b.days_; }
    friend bool operator!=(Date a, Date b) noexcept { return a.days_ != b.days_; }
    friend bool operator<(Date a, Date b) noexcept { return a.days_ < b.days_; }
    friend bool operator<=(Date a, Date b) noexcept { return a.days_ <= b.days_; }
    friend bool operator>(Date a, Date b) noexcept { return a.days_ > b.days_; }
    friend bool operator>=(Date a, Date b) noexcept { return a.days_ >= b.days_; }

private:
    explicit Date(std::int64_t days) : days_(days) {}

    std::int64_t days_ = 0;
};

/**
 * Parse a point-in-time string as UTC.
 * Accepts "yyyy-MM-dd HH:mm:ss" and bare "yyyy-MM-dd" (midnight).
 */
std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept;

/// "yyyy-MM-dd HH:mm:ss" in UTC
std::string format_timestamp(Timestamp ts);

std::int64_t to_unix_millis(Timestamp ts) noexcept;
Timestamp from_unix_millis(std::int64_t millis) noexcept;

} // namespace hsync
