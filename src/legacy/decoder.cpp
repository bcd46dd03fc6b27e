#include "hsync/legacy/decoder.hpp"

#include <cctype>
#include <charconv>
#include <map>
#include <vector>

namespace hsync::legacy {
namespace {

using model::Weekday;

std::string lowercase_trimmed(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    std::string out;
    out.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
    }
    return out;
}

// Whole-word split on anything that is not a letter or digit
std::vector<std::string> words_of(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(c);
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::optional<int> parse_int(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> count_word(const std::string& word) {
    if (word == "once") return 1;
    if (word == "twice") return 2;
    if (word == "thrice") return 3;
    return parse_int(word);
}

std::optional<Weekday> weekday_word(const std::string& word) {
    static const std::map<std::string, Weekday> names = {
        {"sun", Weekday::Sunday}, {"sunday", Weekday::Sunday}, {"sundays", Weekday::Sunday},
        {"mon", Weekday::Monday}, {"monday", Weekday::Monday}, {"mondays", Weekday::Monday},
        {"tue", Weekday::Tuesday}, {"tues", Weekday::Tuesday}, {"tuesday", Weekday::Tuesday},
        {"tuesdays", Weekday::Tuesday},
        {"wed", Weekday::Wednesday}, {"weds", Weekday::Wednesday}, {"wednesday", Weekday::Wednesday},
        {"wednesdays", Weekday::Wednesday},
        {"thu", Weekday::Thursday}, {"thur", Weekday::Thursday}, {"thurs", Weekday::Thursday},
        {"thursday", Weekday::Thursday}, {"thursdays", Weekday::Thursday},
        {"fri", Weekday::Friday}, {"friday", Weekday::Friday}, {"fridays", Weekday::Friday},
        {"sat", Weekday::Saturday}, {"saturday", Weekday::Saturday}, {"saturdays", Weekday::Saturday},
    };
    auto it = names.find(word);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool is_unit_word(const std::string& word) {
    return word == "day" || word == "days" || word == "time" || word == "times";
}

ParseOutcome<model::Schedule> fallback(const std::string& text, const std::string& reason) {
    return {model::Daily{}, "Unrecognized schedule '" + text + "' (" + reason + "); using daily"};
}

// "3 days a week", "twice a month", "4 times per week"
std::optional<ParseOutcome<model::Schedule>> parse_frequency(const std::vector<std::string>& words,
                                                              const std::string& text) {
    std::size_t i = 0;
    auto count = count_word(words[i++]);
    if (!count) {
        return std::nullopt;
    }
    if (i < words.size() && is_unit_word(words[i])) ++i;
    if (i < words.size() && (words[i] == "a" || words[i] == "per" || words[i] == "each")) ++i;
    if (i + 1 != words.size()) {
        return std::nullopt;
    }

    const std::string& period = words[i];
    if (period == "week") {
        if (*count < 1 || *count > 7) {
            return fallback(text, "weekly count out of range");
        }
        return ParseOutcome<model::Schedule>{model::TimesPerWeek{*count}, std::nullopt};
    }
    if (period == "month") {
        if (*count < 1 || *count > 31) {
            return fallback(text, "monthly count out of range");
        }
        return ParseOutcome<model::Schedule>{model::TimesPerMonth{*count}, std::nullopt};
    }
    return std::nullopt;
}

// "every 3 days", "every other day"
std::optional<ParseOutcome<model::Schedule>> parse_interval(const std::vector<std::string>& words,
                                                             const std::string& text) {
    if (words.size() != 3 || words[0] != "every" || (words[2] != "day" && words[2] != "days")) {
        return std::nullopt;
    }
    auto n = words[1] == "other" ? std::optional<int>(2) : parse_int(words[1]);
    if (!n) {
        return std::nullopt;
    }
    if (*n < 1) {
        return fallback(text, "interval must be positive");
    }
    if (*n == 1) {
        return ParseOutcome<model::Schedule>{model::Daily{}, std::nullopt};
    }
    return ParseOutcome<model::Schedule>{model::EveryNDays{*n}, std::nullopt};
}

// "Mon, Wed and Fri", "every tuesday"
std::optional<model::WeekdaySet> parse_day_list(const std::vector<std::string>& words) {
    model::WeekdaySet days;
    for (const auto& word : words) {
        if (word == "and" || word == "on" || word == "every") {
            continue;
        }
        auto day = weekday_word(word);
        if (!day) {
            return std::nullopt;
        }
        days.insert(*day);
    }
    if (days.empty()) {
        return std::nullopt;
    }
    return days;
}

} // namespace

ParseOutcome<model::Goal> parse_goal(std::string_view text) {
    const std::string normalized = lowercase_trimmed(text);

    std::size_t digits = 0;
    while (digits < normalized.size() && std::isdigit(static_cast<unsigned char>(normalized[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return {model::Goal{}, "Goal '" + std::string(text) + "' has no leading count; using 1 time"};
    }

    auto count = parse_int(std::string_view(normalized).substr(0, digits));
    if (!count || *count <= 0) {
        return {model::Goal{}, "Goal '" + std::string(text) + "' has an unusable count; using 1 time"};
    }

    std::string unit = lowercase_trimmed(std::string_view(normalized).substr(digits));
    if (unit.empty()) {
        unit = *count == 1 ? "time" : "times";
    }
    return {model::Goal{*count, unit}, std::nullopt};
}

ParseOutcome<model::Schedule> parse_schedule(std::string_view text) {
    const std::string normalized = lowercase_trimmed(text);
    const auto words = words_of(normalized);
    if (words.empty()) {
        return fallback(std::string(text), "empty");
    }

    const bool single = words.size() == 1;
    if ((single && (words[0] == "everyday" || words[0] == "daily")) ||
        (words.size() == 2 && words[0] == "every" && words[1] == "day")) {
        return {model::Daily{}, std::nullopt};
    }
    if (single && (words[0] == "weekdays" || words[0] == "weekday")) {
        return {model::SpecificWeekdays{{Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday,
                                         Weekday::Thursday, Weekday::Friday}},
                std::nullopt};
    }
    if (single && (words[0] == "weekends" || words[0] == "weekend")) {
        return {model::SpecificWeekdays{{Weekday::Saturday, Weekday::Sunday}}, std::nullopt};
    }

    if (auto interval = parse_interval(words, std::string(text))) {
        return *interval;
    }
    if (auto frequency = parse_frequency(words, std::string(text))) {
        return *frequency;
    }
    if (auto days = parse_day_list(words)) {
        return {model::SpecificWeekdays{*days}, std::nullopt};
    }
    return fallback(std::string(text), "unknown phrase");
}

DecodedHabit decode_habit(const model::HabitRecord& legacy, const std::string& user_id) {
    DecodedHabit decoded;
    model::NormalizedHabit& habit = decoded.habit;
    habit.id = legacy.id;
    habit.user_id = user_id;
    habit.name = legacy.name;
    habit.description = legacy.description;
    habit.icon = legacy.icon;
    habit.color = legacy.color;
    habit.habit_type = legacy.habit_type;
    habit.baseline_count = legacy.baseline;
    habit.target_count = legacy.target;
    habit.start_date = legacy.start_date;
    habit.end_date = legacy.end_date;
    habit.created_at = legacy.created_at;
    habit.updated_at = legacy.last_modified;
    habit.is_deleted = legacy.is_deleted;

    auto goal = parse_goal(legacy.goal);
    habit.goal = goal.value;
    if (goal.warning) {
        decoded.warnings.push_back("habit " + legacy.id + ": " + *goal.warning);
    }

    auto schedule = parse_schedule(legacy.schedule);
    habit.schedule = schedule.value;
    if (schedule.warning) {
        decoded.warnings.push_back("habit " + legacy.id + ": " + *schedule.warning);
    }
    return decoded;
}

} // namespace hsync::legacy
