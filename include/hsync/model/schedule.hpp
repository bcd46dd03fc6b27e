#pragma once

#include "hsync/core/date.hpp"

#include <bitset>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>

namespace hsync::model {

/// Weekday numbering follows Date::weekday(): 0 = Sunday ... 6 = Saturday
enum class Weekday : unsigned {
    Sunday = 0,
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday
};

class WeekdaySet {
public:
    WeekdaySet() = default;
    WeekdaySet(std::initializer_list<Weekday> days) {
        for (auto d : days) {
            insert(d);
        }
    }

    void insert(Weekday day) { bits_.set(static_cast<unsigned>(day)); }
    bool contains(Weekday day) const { return bits_.test(static_cast<unsigned>(day)); }
    bool contains(unsigned weekday) const { return weekday < 7 && bits_.test(weekday); }
    std::size_t size() const { return bits_.count(); }
    bool empty() const { return bits_.none(); }

    friend bool operator==(const WeekdaySet& a, const WeekdaySet& b) { return a.bits_ == b.bits_; }
    friend bool operator!=(const WeekdaySet& a, const WeekdaySet& b) { return a.bits_ != b.bits_; }

private:
    std::bitset<7> bits_;
};

struct Daily {};

struct EveryNDays {
    int n = 1;
};

struct SpecificWeekdays {
    WeekdaySet days;
};

struct TimesPerWeek {
    int n = 1;
};

struct TimesPerMonth {
    int n = 1;
};

inline bool operator==(const Daily&, const Daily&) { return true; }
inline bool operator==(const EveryNDays& a, const EveryNDays& b) { return a.n == b.n; }
inline bool operator==(const SpecificWeekdays& a, const SpecificWeekdays& b) { return a.days == b.days; }
inline bool operator==(const TimesPerWeek& a, const TimesPerWeek& b) { return a.n == b.n; }
inline bool operator==(const TimesPerMonth& a, const TimesPerMonth& b) { return a.n == b.n; }

/**
 * @brief Structured recurrence decoded from the legacy schedule string
 *
 * Interval kinds (Daily, EveryNDays, SpecificWeekdays) appear only on their
 * days. Frequency kinds (TimesPerWeek, TimesPerMonth) appear every day and the
 * user chooses which days to complete.
 */
using Schedule = std::variant<Daily, EveryNDays, SpecificWeekdays, TimesPerWeek, TimesPerMonth>;

/**
 * Whether a habit with this schedule is due on `date`.
 * Never before `start`, never after `end` when one is set.
 */
bool should_appear(const Schedule& schedule, Date date, Date start,
                   const std::optional<Date>& end = std::nullopt);

bool is_frequency_based(const Schedule& schedule);

/// Stable kind name used in migration summaries ("daily", "every_n_days", ...)
std::string schedule_kind(const Schedule& schedule);

/// Human-readable form, e.g. "Every 3 days", "Every Monday, Friday"
std::string describe(const Schedule& schedule);

std::string weekday_name(Weekday day);

} // namespace hsync::model
