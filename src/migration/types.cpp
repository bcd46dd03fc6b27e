#include "hsync/migration/types.hpp"

#include <algorithm>

namespace hsync::migration {

const char* to_string(MigrationPhase phase) noexcept {
    switch (phase) {
        case MigrationPhase::NotStarted: return "not_started";
        case MigrationPhase::ValidatingSource: return "validating_source";
        case MigrationPhase::MigratingHabits: return "migrating_habits";
        case MigrationPhase::MigratingStreak: return "migrating_streak";
        case MigrationPhase::MigratingPoints: return "migrating_points";
        case MigrationPhase::Validating: return "validating";
        case MigrationPhase::Committed: return "committed";
        case MigrationPhase::Failed: return "failed";
        case MigrationPhase::RolledBack: return "rolled_back";
    }
    return "not_started";
}

RecordManifest MigrationBatch::manifest() const {
    RecordManifest manifest;
    manifest.user_id = user_id;
    for (const auto& habit : habits) {
        manifest.habit_ids.push_back(habit.id);
    }
    for (const auto& record : progress) {
        manifest.progress_ids.push_back(record.id);
    }
    if (streak) {
        manifest.streak_ids.push_back(streak->id);
    }
    if (user_progress) {
        manifest.user_progress_ids.push_back(user_progress->id);
        for (const auto& transaction : user_progress->transactions) {
            manifest.transaction_ids.push_back(transaction.id);
        }
    }
    return manifest;
}

bool ValidationReport::passed() const {
    return std::all_of(checks.begin(), checks.end(), [](const CheckResult& c) { return c.passed; });
}

std::vector<std::string> ValidationReport::hard_errors() const {
    std::vector<std::string> errors;
    for (const auto& check : checks) {
        if (!check.passed) {
            errors.push_back(check.name + ": " + check.detail);
        }
    }
    return errors;
}

} // namespace hsync::migration
