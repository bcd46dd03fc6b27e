#include "hsync/model/schedule.hpp"

#include <sstream>

namespace hsync::model {
namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

bool should_appear(const Schedule& schedule, Date date, Date start, const std::optional<Date>& end) {
    if (date < start) {
        return false;
    }
    if (end && date > *end) {
        return false;
    }

    return std::visit(Overloaded{
        [](const Daily&) { return true; },
        [&](const EveryNDays& s) {
            if (s.n <= 0) {
                return false;
            }
            return start.days_until(date) % s.n == 0;
        },
        [&](const SpecificWeekdays& s) { return s.days.contains(date.weekday()); },
        [](const TimesPerWeek&) { return true; },
        [](const TimesPerMonth&) { return true; },
    }, schedule);
}

bool is_frequency_based(const Schedule& schedule) {
    return std::holds_alternative<TimesPerWeek>(schedule) ||
           std::holds_alternative<TimesPerMonth>(schedule);
}

std::string schedule_kind(const Schedule& schedule) {
    return std::visit(Overloaded{
        [](const Daily&) { return std::string("daily"); },
        [](const EveryNDays&) { return std::string("every_n_days"); },
        [](const SpecificWeekdays&) { return std::string("specific_weekdays"); },
        [](const TimesPerWeek&) { return std::string("times_per_week"); },
        [](const TimesPerMonth&) { return std::string("times_per_month"); },
    }, schedule);
}

std::string weekday_name(Weekday day) {
    switch (day) {
        case Weekday::Sunday: return "Sunday";
        case Weekday::Monday: return "Monday";
        case Weekday::Tuesday: return "Tuesday";
        case Weekday::Wednesday: return "Wednesday";
        case Weekday::Thursday: return "Thursday";
        case Weekday::Friday: return "Friday";
        case Weekday::Saturday: return "Saturday";
    }
    return "Sunday";
}

std::string describe(const Schedule& schedule) {
    return std::visit(Overloaded{
        [](const Daily&) { return std::string("Every day"); },
        [](const EveryNDays& s) {
            return s.n == 1 ? std::string("Every day") : "Every " + std::to_string(s.n) + " days";
        },
        [](const SpecificWeekdays& s) {
            if (s.days.size() == 7) {
                return std::string("Every day");
            }
            std::ostringstream oss;
            oss << "Every ";
            bool first = true;
            for (unsigned d = 0; d < 7; ++d) {
                if (!s.days.contains(d)) {
                    continue;
                }
                if (!first) {
                    oss << ", ";
                }
                oss << weekday_name(static_cast<Weekday>(d));
                first = false;
            }
            return oss.str();
        },
        [](const TimesPerWeek& s) {
            return s.n == 1 ? std::string("Once a week") : std::to_string(s.n) + " days a week";
        },
        [](const TimesPerMonth& s) {
            return s.n == 1 ? std::string("Once a month") : std::to_string(s.n) + " days a month";
        },
    }, schedule);
}

} // namespace hsync::model
