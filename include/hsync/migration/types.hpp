#pragma once

#include "hsync/core/error.hpp"
#include "hsync/model/normalized.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hsync::migration {

enum class MigrationPhase {
    NotStarted,
    ValidatingSource,
    MigratingHabits,
    MigratingStreak,
    MigratingPoints,
    Validating,
    Committed,
    Failed,
    RolledBack
};

const char* to_string(MigrationPhase phase) noexcept;

/// One entry of the legacy points history, timestamp still as stored
struct LegacyPointEntry {
    std::string timestamp;   // "yyyy-MM-dd HH:mm:ss" or "yyyy-MM-dd"
    std::int64_t amount = 0;
    std::string reason;
};

struct LegacyPointsSnapshot {
    std::int64_t total_points = 0;
    std::optional<int> stored_level;
    std::vector<LegacyPointEntry> history;   // empty for data that predates the ledger
};

/**
 * @brief Identity of every record one migration run creates
 *
 * Persisted with the flag store before the commit so that a later process can
 * undo an interrupted run without any in-memory state.
 */
struct RecordManifest {
    std::string user_id;
    std::vector<std::string> habit_ids;
    std::vector<std::string> progress_ids;
    std::vector<std::string> streak_ids;
    std::vector<std::string> transaction_ids;
    std::vector<std::string> user_progress_ids;

    std::size_t size() const {
        return habit_ids.size() + progress_ids.size() + streak_ids.size() +
               transaction_ids.size() + user_progress_ids.size();
    }
    bool empty() const { return size() == 0; }
};

/// Everything one run produces, held in memory until the commit
struct MigrationBatch {
    std::string user_id;
    std::vector<model::NormalizedHabit> habits;
    std::vector<model::DailyProgress> progress;
    std::optional<model::GlobalStreak> streak;
    std::optional<model::UserProgress> user_progress;

    RecordManifest manifest() const;
};

struct CheckResult {
    std::string name;
    bool passed = true;
    std::string detail;
};

struct ValidationReport {
    std::vector<CheckResult> checks;
    std::vector<std::string> warnings;

    bool passed() const;
    std::vector<std::string> hard_errors() const;
};

struct MigrationSummary {
    MigrationPhase phase = MigrationPhase::NotStarted;
    bool dry_run = false;
    std::string user_id;
    std::chrono::milliseconds duration{0};

    std::size_t habits_created = 0;
    std::size_t habits_rejected = 0;
    std::size_t progress_records_created = 0;
    std::size_t transactions_created = 0;
    std::map<std::string, std::size_t> schedule_kinds;
    std::vector<std::string> decoder_warnings;
    std::vector<std::string> skipped_date_keys;
    std::size_t skipped_point_entries = 0;

    std::optional<model::GlobalStreak> streak;
    std::int64_t total_points = 0;
    int level = 1;

    ValidationReport validation;
    bool recovered_interrupted_run = false;
    std::optional<Error> error;

    bool succeeded() const { return phase == MigrationPhase::Committed && !error; }
};

} // namespace hsync::migration
