#include "hsync/streak/recompute.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <optional>
#include <utility>

namespace hsync::streak {

model::GlobalStreak recompute(const std::vector<model::NormalizedHabit>& habits,
                              const std::vector<model::DailyProgress>& progress,
                              const ExceptionCalendar& calendar,
                              const std::string& user_id,
                              Date today) {
    model::GlobalStreak streak;
    streak.id = "streak:" + user_id;
    streak.user_id = user_id;

    std::vector<const model::NormalizedHabit*> active;
    for (const auto& habit : habits) {
        if (!habit.is_deleted) {
            active.push_back(&habit);
        }
    }

    // (habit id, date) -> progress record
    std::map<std::pair<std::string, std::int64_t>, const model::DailyProgress*> by_day;
    std::optional<Date> earliest;
    for (const auto& record : progress) {
        by_day[{record.habit_id, record.date.days_since_epoch()}] = &record;
        if (!earliest || record.date < *earliest) {
            earliest = record.date;
        }
    }
    if (active.empty() || !earliest || *earliest > today) {
        return streak;
    }

    int running = 0;
    for (Date day = *earliest; day <= today; day = day.add_days(1)) {
        if (calendar.is_exception_day(day, user_id)) {
            continue;
        }

        bool any_scheduled = false;
        bool all_met = true;
        for (const auto* habit : active) {
            if (!model::should_appear(habit->schedule, day, habit->start_date, habit->end_date)) {
                continue;
            }
            any_scheduled = true;
            auto it = by_day.find({habit->id, day.days_since_epoch()});
            if (it == by_day.end() || !it->second->is_complete()) {
                all_met = false;
                break;
            }
        }
        if (!any_scheduled) {
            continue;
        }

        if (all_met) {
            ++running;
            ++streak.total_complete_days;
            streak.last_complete_date = day;
            if (running > streak.longest_streak) {
                streak.longest_streak = running;
            }
        } else {
            running = 0;
        }
    }

    const bool recent = streak.last_complete_date && *streak.last_complete_date >= today.add_days(-1);
    streak.current_streak = recent ? running : 0;

    spdlog::debug("[StreakEngine] user={} current={} longest={} total={}",
                  user_id, streak.current_streak, streak.longest_streak, streak.total_complete_days);
    return streak;
}

} // namespace hsync::streak
