#pragma once

#include "hsync/model/normalized.hpp"
#include "hsync/model/schedule.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hsync::legacy {

/**
 * @brief Decoded value plus the warning raised when a fallback was used
 *
 * Decoding never fails: a malformed legacy string yields a safe default and
 * a warning, so one bad habit cannot abort a migration.
 */
template<typename T>
struct ParseOutcome {
    T value;
    std::optional<std::string> warning;

    bool used_fallback() const { return warning.has_value(); }
};

/**
 * "5 times" -> {5, "times"}, "30 Minutes" -> {30, "minutes"}, "3" -> {3, "times"},
 * "1" -> {1, "time"}. No leading count, or a count of zero -> {1, "time"} with a warning.
 */
ParseOutcome<model::Goal> parse_goal(std::string_view text);

/**
 * Known phrases: everyday/daily/every day, weekdays, weekends, every N days,
 * N days a week, once/twice a week, N days a month, once/twice a month, and
 * any list of day names. Anything else decodes as Daily with a warning.
 */
ParseOutcome<model::Schedule> parse_schedule(std::string_view text);

struct DecodedHabit {
    model::NormalizedHabit habit;
    std::vector<std::string> warnings;
};

/// Legacy record -> normalized habit owned by `user_id`; never fails
DecodedHabit decode_habit(const model::HabitRecord& legacy, const std::string& user_id);

} // namespace hsync::legacy
