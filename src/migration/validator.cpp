#include "hsync/migration/validator.hpp"

#include <set>

namespace hsync::migration {
namespace {

void check(ValidationReport& report, std::string name, bool passed, std::string detail = {}) {
    report.checks.push_back(CheckResult{std::move(name), passed, passed ? std::string() : std::move(detail)});
}

} // namespace

ValidationReport validate_batch(const MigrationBatch& batch, const ValidationInputs& inputs) {
    ValidationReport report;

    const std::size_t expected_habits = inputs.legacy_habit_count - inputs.rejected_habit_count;
    check(report, "habit_count", batch.habits.size() == expected_habits,
          "expected " + std::to_string(expected_habits) + ", created " + std::to_string(batch.habits.size()));

    const std::size_t expected_progress = inputs.legacy_progress_entries - inputs.skipped_date_keys;
    check(report, "progress_count", batch.progress.size() == expected_progress,
          "expected " + std::to_string(expected_progress) + ", created " + std::to_string(batch.progress.size()));

    std::set<std::string> habit_ids;
    bool goals_positive = true;
    std::string bad_goal;
    for (const auto& habit : batch.habits) {
        habit_ids.insert(habit.id);
        if (habit.goal.count <= 0 && goals_positive) {
            goals_positive = false;
            bad_goal = habit.id;
        }
    }
    check(report, "goal_counts_positive", goals_positive, "habit " + bad_goal + " has goal count <= 0");

    std::size_t orphans = 0;
    const Date earliest_usual = inputs.today.add_days(-inputs.unusual_date_past_days);
    const Date latest_usual = inputs.today.add_days(inputs.unusual_date_future_days);
    std::size_t unusual = 0;
    for (const auto& record : batch.progress) {
        if (habit_ids.count(record.habit_id) == 0) {
            ++orphans;
        }
        if (record.date < earliest_usual || record.date > latest_usual) {
            ++unusual;
        }
    }
    check(report, "no_orphaned_progress", orphans == 0,
          std::to_string(orphans) + " progress records without a habit");

    if (batch.streak) {
        check(report, "streak_monotonic", batch.streak->is_consistent(),
              "current " + std::to_string(batch.streak->current_streak) +
              ", longest " + std::to_string(batch.streak->longest_streak) +
              ", total " + std::to_string(batch.streak->total_complete_days));
    } else {
        check(report, "streak_monotonic", false, "no streak record");
    }

    if (batch.user_progress) {
        const auto& progress = *batch.user_progress;
        check(report, "ledger_conserved", progress.ledger_sum() == progress.total_points,
              "ledger sums to " + std::to_string(progress.ledger_sum()) +
              ", total is " + std::to_string(progress.total_points));
        const int derived = model::level_for_points(progress.total_points);
        check(report, "level_derived", progress.level == derived,
              "stored " + std::to_string(progress.level) + ", derived " + std::to_string(derived));
        check(report, "total_preserved", progress.total_points == inputs.legacy_total_points,
              "migrated " + std::to_string(progress.total_points) +
              ", legacy " + std::to_string(inputs.legacy_total_points));
    } else {
        check(report, "ledger_conserved", false, "no user progress record");
    }

    if (unusual > 0) {
        report.warnings.push_back(std::to_string(unusual) + " progress records dated outside " +
                                  earliest_usual.to_string() + " .. " + latest_usual.to_string());
    }
    for (const auto& warning : inputs.decoder_warnings) {
        report.warnings.push_back(warning);
    }
    return report;
}

} // namespace hsync::migration
