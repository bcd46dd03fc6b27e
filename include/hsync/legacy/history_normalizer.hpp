#pragma once

#include "hsync/model/habit_record.hpp"
#include "hsync/model/normalized.hpp"

#include <string>
#include <vector>

namespace hsync::legacy {

struct NormalizedHistory {
    std::vector<model::DailyProgress> progress;   // ordered by date
    std::vector<std::string> skipped_keys;        // unparseable date keys
};

/**
 * One DailyProgress per date key of the legacy progress history: completion
 * history for formation habits, actual usage for breaking habits. Each record
 * snapshots the habit's current goal count and carries the difficulty rated
 * on the same date key, if any. Progress ids are "<habit id>:<yyyy-MM-dd>".
 */
NormalizedHistory normalize_history(const model::HabitRecord& legacy, const model::NormalizedHabit& habit);

std::string progress_id(const std::string& habit_id, Date date);

} // namespace hsync::legacy
