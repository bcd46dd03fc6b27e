#pragma once

#include "hsync/core/date.hpp"
#include "hsync/model/habit_record.hpp"
#include "hsync/model/schedule.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hsync::model {

struct Goal {
    int count = 1;
    std::string unit = "time";

    friend bool operator==(const Goal& a, const Goal& b) { return a.count == b.count && a.unit == b.unit; }
    friend bool operator!=(const Goal& a, const Goal& b) { return !(a == b); }
};

/**
 * @brief Habit in the normalized schema, created by the migration
 *
 * Owns its DailyProgress records through `habit_id` (cascade on delete).
 */
struct NormalizedHabit {
    std::string id;
    std::string user_id;
    std::string name;
    std::string description;
    std::string icon;
    std::string color;
    HabitType habit_type = HabitType::Formation;
    Goal goal;
    Schedule schedule = Daily{};
    int baseline_count = 0;
    int target_count = 0;
    Date start_date;
    std::optional<Date> end_date;
    Timestamp created_at{};
    Timestamp updated_at{};
    bool is_deleted = false;
};

/**
 * @brief Activity recorded for one habit on one calendar day
 *
 * goal_count is a snapshot of the habit goal at migration time, so later goal
 * edits do not rewrite history.
 */
struct DailyProgress {
    std::string id;
    std::string habit_id;
    Date date;
    int progress_count = 0;
    int goal_count = 1;
    HabitType habit_type = HabitType::Formation;
    std::optional<int> difficulty;

    bool is_complete() const {
        return habit_type == HabitType::Breaking ? progress_count <= goal_count
                                                 : progress_count >= goal_count;
    }
};

struct GlobalStreak {
    std::string id;
    std::string user_id;
    int current_streak = 0;
    int longest_streak = 0;
    int total_complete_days = 0;
    std::optional<Date> last_complete_date;

    /// current <= longest <= total_complete_days
    bool is_consistent() const {
        return current_streak >= 0 && current_streak <= longest_streak &&
               longest_streak <= total_complete_days;
    }
};

struct PointTransaction {
    std::string id;
    std::string user_id;
    std::int64_t amount = 0;
    std::string reason;
    Timestamp timestamp{};
};

/**
 * @brief Points total, derived level, and the append-only ledger
 *
 * total_points must equal the sum of transaction amounts, and level must equal
 * level_for_points(total_points).
 */
struct UserProgress {
    std::string id;
    std::string user_id;
    std::int64_t total_points = 0;
    int level = 1;
    std::vector<PointTransaction> transactions;

    std::int64_t ledger_sum() const;
    std::int64_t points_into_level() const;
    std::int64_t points_for_next_level() const;
};

/// Points needed to finish level `level` (level n costs n * 1000)
std::int64_t points_required_for_level(int level);

/// Points accumulated when reaching `level`
std::int64_t cumulative_points_for_level(int level);

/// Highest level whose cumulative requirement is covered by `total_points`
int level_for_points(std::int64_t total_points);

} // namespace hsync::model
