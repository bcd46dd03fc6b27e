#pragma once

#include "hsync/model/normalized.hpp"
#include "hsync/streak/exception_calendar.hpp"

#include <string>
#include <vector>

namespace hsync::streak {

/**
 * @brief Rebuild the global streak from raw progress
 *
 * Walks every day from the earliest progress date to `today`. Exception days
 * and days with nothing scheduled are skipped. A day with scheduled habits is
 * complete only when each of them has a progress record meeting its goal.
 * Deleted habits are ignored.
 *
 * The current streak survives only if the last complete day is today or
 * yesterday. Cost is O(days * habits); stored streak values are never read.
 */
model::GlobalStreak recompute(const std::vector<model::NormalizedHabit>& habits,
                              const std::vector<model::DailyProgress>& progress,
                              const ExceptionCalendar& calendar,
                              const std::string& user_id,
                              Date today);

} // namespace hsync::streak
