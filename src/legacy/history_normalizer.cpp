#include "hsync/legacy/history_normalizer.hpp"

#include <spdlog/spdlog.h>

namespace hsync::legacy {

std::string progress_id(const std::string& habit_id, Date date) {
    return habit_id + ":" + date.to_string();
}

NormalizedHistory normalize_history(const model::HabitRecord& legacy, const model::NormalizedHabit& habit) {
    NormalizedHistory out;
    // Strict yyyy-MM-dd keys sort lexicographically in date order
    const auto& history = legacy.progress_history();

    for (const auto& [key, count] : history) {
        auto date = Date::parse(key);
        if (!date) {
            spdlog::warn("[HistoryNormalizer] habit={} skipping malformed date key '{}'", legacy.id, key);
            out.skipped_keys.push_back(key);
            continue;
        }

        model::DailyProgress progress;
        progress.id = progress_id(habit.id, *date);
        progress.habit_id = habit.id;
        progress.date = *date;
        progress.progress_count = count;
        progress.goal_count = habit.goal.count;
        progress.habit_type = habit.habit_type;

        auto rating = legacy.difficulty_history.find(key);
        if (rating != legacy.difficulty_history.end()) {
            progress.difficulty = rating->second;
        }
        out.progress.push_back(std::move(progress));
    }
    return out;
}

} // namespace hsync::legacy
