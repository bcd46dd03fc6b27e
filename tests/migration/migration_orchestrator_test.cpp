#include "hsync/events/components.hpp"
#include "hsync/io/json_codec.hpp"
#include "hsync/migration/memory_stores.hpp"
#include "hsync/migration/orchestrator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace hsync;
using migration::InMemoryLegacySource;
using migration::InMemoryMigrationFlagStore;
using migration::InMemoryNormalizedStore;
using migration::MigrationOrchestrator;
using migration::MigrationPhase;

namespace {

const std::string kUser = "user-1";

model::HabitRecord legacy_habit(const std::string& id, model::DateCountMap history) {
    model::HabitRecord record;
    record.id = id;
    record.name = "Habit " + id;
    record.goal = "1 time";
    record.schedule = "Everyday";
    record.start_date = *Date::parse("2025-01-01");
    record.created_at = *parse_timestamp("2025-01-01 08:00:00");
    record.last_modified = record.created_at;
    record.completion_history = std::move(history);
    return record;
}

class RecordingObserver : public migration::MigrationObserver {
public:
    void on_progress(const std::string& step, int percent_complete) override {
        steps.push_back(step);
        percents.push_back(percent_complete);
    }
    void on_error(const Error& error) override { errors.push_back(error); }
    void on_complete(const migration::MigrationSummary& summary) override { completed.push_back(summary); }

    std::vector<std::string> steps;
    std::vector<int> percents;
    std::vector<Error> errors;
    std::vector<migration::MigrationSummary> completed;
};

class MigrationOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        legacy.set_habits(kUser, {
            legacy_habit("a", {{"2025-01-01", 1}, {"2025-01-02", 1}, {"2025-01-03", 1}, {"2025-01-04", 1}}),
            legacy_habit("b", {{"2025-01-01", 1}, {"2025-01-02", 1}, {"2025-01-03", 0}, {"2025-01-04", 1}}),
        });
        migration::LegacyPointsSnapshot points;
        points.total_points = 1500;
        points.stored_level = 4;
        legacy.set_points(kUser, points);

        config.migration.user_id = kUser;
    }

    MigrationOrchestrator make(events::EventBus* bus = nullptr, migration::MigrationObserver* observer = nullptr) {
        return MigrationOrchestrator(legacy, store, flags, calendar, config, clock, bus, observer);
    }

    std::size_t record_count() {
        auto count = store.count_records(kUser);
        EXPECT_TRUE(count.is_ok());
        return count.is_ok() ? count.value() : 0;
    }

    std::string legacy_dump() {
        io::LegacyDataset dataset;
        dataset.user_id = kUser;
        dataset.habits = legacy.load_habits(kUser).value();
        dataset.points = legacy.load_points(kUser).value();
        return io::dataset_to_json(dataset).dump();
    }

    InMemoryLegacySource legacy;
    InMemoryNormalizedStore store;
    InMemoryMigrationFlagStore flags;
    streak::NoExceptions calendar;
    FixedClock clock{*Date::parse("2025-01-04")};
    EngineConfig config;
};

// habits (2) + progress (8) + streak (1) + user progress (1) + transactions (1)
constexpr std::size_t kMigratedRecords = 13;

} // namespace

TEST_F(MigrationOrchestratorTest, MigratesUserEndToEnd) {
    auto orchestrator = make();
    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    const auto& summary = result.value();
    EXPECT_TRUE(summary.succeeded());
    EXPECT_EQ(summary.phase, MigrationPhase::Committed);
    EXPECT_EQ(summary.habits_created, 2u);
    EXPECT_EQ(summary.progress_records_created, 8u);
    EXPECT_EQ(summary.transactions_created, 1u);
    EXPECT_EQ(summary.schedule_kinds.at("daily"), 2u);
    EXPECT_EQ(summary.total_points, 1500);
    EXPECT_EQ(summary.level, 2);
    EXPECT_TRUE(summary.validation.passed());

    ASSERT_TRUE(summary.streak.has_value());
    EXPECT_EQ(summary.streak->longest_streak, 2);
    EXPECT_EQ(summary.streak->current_streak, 1);
    EXPECT_EQ(summary.streak->total_complete_days, 3);

    EXPECT_EQ(record_count(), kMigratedRecords);
    EXPECT_EQ(store.commit_count(), 1u);
    auto flag = flags.state(kUser);
    ASSERT_TRUE(flag.is_ok());
    EXPECT_TRUE(flag.value().completed);
    ASSERT_TRUE(flag.value().manifest.has_value());
    EXPECT_EQ(flag.value().manifest->size(), kMigratedRecords);

    auto committed = store.load(kUser);
    ASSERT_TRUE(committed.is_ok());
    ASSERT_TRUE(committed.value().user_progress.has_value());
    EXPECT_EQ(committed.value().user_progress->level, 2);
}

TEST_F(MigrationOrchestratorTest, SecondRunIsRefusedWithoutWrites) {
    auto orchestrator = make();
    ASSERT_TRUE(orchestrator.migrate().is_ok());

    auto second = orchestrator.migrate();
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ErrorCode::AlreadyMigrated);

    auto summary = orchestrator.last_summary();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->phase, MigrationPhase::Failed);
    EXPECT_EQ(store.commit_count(), 1u);
    EXPECT_EQ(record_count(), kMigratedRecords);
    EXPECT_TRUE(flags.state(kUser).value().completed);
}

TEST_F(MigrationOrchestratorTest, DryRunComputesEverythingAndWritesNothing) {
    config.migration.dry_run = true;
    auto orchestrator = make();

    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().dry_run);
    EXPECT_EQ(result.value().habits_created, 2u);
    EXPECT_EQ(result.value().progress_records_created, 8u);
    EXPECT_TRUE(result.value().validation.passed());

    EXPECT_EQ(record_count(), 0u);
    EXPECT_EQ(store.commit_count(), 0u);
    EXPECT_FALSE(flags.state(kUser).value().completed);
    EXPECT_FALSE(flags.state(kUser).value().manifest.has_value());
}

TEST_F(MigrationOrchestratorTest, CommitFailureRollsBack) {
    store.fail_commit(true);
    auto orchestrator = make();

    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::CommitFailed);
    EXPECT_EQ(orchestrator.last_summary()->phase, MigrationPhase::RolledBack);
    EXPECT_EQ(record_count(), 0u);
    EXPECT_FALSE(flags.state(kUser).value().manifest.has_value());
}

TEST_F(MigrationOrchestratorTest, FailureAfterCommitRemovesEverythingAndLeavesLegacyIntact) {
    const std::string before = legacy_dump();
    flags.fail_mark_completed(true);
    auto orchestrator = make();

    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::CommitFailed);
    EXPECT_EQ(store.commit_count(), 1u);
    EXPECT_EQ(record_count(), 0u);
    EXPECT_EQ(orchestrator.last_summary()->phase, MigrationPhase::RolledBack);
    EXPECT_EQ(legacy_dump(), before);

    // Rolled back cleanly, so a later run succeeds
    flags.fail_mark_completed(false);
    EXPECT_TRUE(orchestrator.migrate().is_ok());
}

TEST_F(MigrationOrchestratorTest, UnreadableLegacyStoreFails) {
    legacy.fail_reads(true);
    auto orchestrator = make();

    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::StoreFailure);
    EXPECT_EQ(orchestrator.last_summary()->phase, MigrationPhase::RolledBack);
    EXPECT_EQ(record_count(), 0u);
}

TEST_F(MigrationOrchestratorTest, RecoversFromInterruptedRun) {
    // A previous process committed part of a batch and died before the flag
    migration::MigrationBatch partial;
    partial.user_id = kUser;
    model::NormalizedHabit stray;
    stray.id = "a";
    stray.user_id = kUser;
    partial.habits.push_back(stray);
    ASSERT_TRUE(flags.record_manifest(kUser, partial.manifest()).is_ok());
    ASSERT_TRUE(store.commit(partial).is_ok());

    auto orchestrator = make();
    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_TRUE(result.value().recovered_interrupted_run);
    EXPECT_EQ(record_count(), kMigratedRecords);
    EXPECT_TRUE(flags.state(kUser).value().completed);
}

TEST_F(MigrationOrchestratorTest, InterruptedRunWithoutRetryOnlyCleansUp) {
    config.migration.auto_retry_after_recovery = false;
    migration::MigrationBatch partial;
    partial.user_id = kUser;
    model::NormalizedHabit stray;
    stray.id = "a";
    partial.habits.push_back(stray);
    ASSERT_TRUE(store.commit(partial).is_ok());

    auto orchestrator = make();
    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InterruptedMigration);
    EXPECT_EQ(orchestrator.last_summary()->phase, MigrationPhase::RolledBack);
    EXPECT_EQ(record_count(), 0u);
}

TEST_F(MigrationOrchestratorTest, DryRunNeverCleansUpInterruptedRun) {
    config.migration.dry_run = true;
    migration::MigrationBatch partial;
    partial.user_id = kUser;
    model::NormalizedHabit stray;
    stray.id = "a";
    partial.habits.push_back(stray);
    ASSERT_TRUE(store.commit(partial).is_ok());

    auto orchestrator = make();
    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InterruptedMigration);
    EXPECT_EQ(orchestrator.last_summary()->phase, MigrationPhase::Failed);
    EXPECT_EQ(record_count(), 1u);
}

TEST_F(MigrationOrchestratorTest, ConcurrentRunIsRefused) {
    ASSERT_TRUE(flags.try_acquire(kUser));
    auto orchestrator = make();

    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::MigrationInProgress);
    EXPECT_EQ(orchestrator.last_summary()->phase, MigrationPhase::Failed);
    EXPECT_EQ(store.commit_count(), 0u);

    flags.release(kUser);
    EXPECT_TRUE(orchestrator.migrate().is_ok());
    // The latch is released again after the run
    EXPECT_TRUE(flags.try_acquire(kUser));
}

TEST_F(MigrationOrchestratorTest, ExplicitRollbackAllowsRemigration) {
    auto orchestrator = make();
    ASSERT_TRUE(orchestrator.migrate().is_ok());

    auto removed = orchestrator.rollback(kUser);
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), kMigratedRecords);
    EXPECT_EQ(record_count(), 0u);
    EXPECT_FALSE(flags.state(kUser).value().completed);

    EXPECT_TRUE(orchestrator.migrate().is_ok());
    EXPECT_EQ(record_count(), kMigratedRecords);
}

TEST_F(MigrationOrchestratorTest, RejectsDuplicateAndEmptyIds) {
    auto habits = legacy.load_habits(kUser).value();
    habits.push_back(legacy_habit("a", {{"2025-01-01", 1}}));
    habits.push_back(legacy_habit("", {{"2025-01-01", 1}}));
    legacy.set_habits(kUser, habits);

    auto orchestrator = make();
    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value().habits_created, 2u);
    EXPECT_EQ(result.value().habits_rejected, 2u);
    EXPECT_EQ(result.value().progress_records_created, 8u);
}

TEST_F(MigrationOrchestratorTest, DecoderFallbacksAreReportedNotFatal) {
    auto habits = legacy.load_habits(kUser).value();
    habits[0].schedule = "when the moon is full";
    habits[1].completion_history["01/05/2025"] = 1;
    legacy.set_habits(kUser, habits);

    auto orchestrator = make();
    auto result = orchestrator.migrate();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value().decoder_warnings.size(), 1u);
    ASSERT_EQ(result.value().skipped_date_keys.size(), 1u);
    EXPECT_EQ(result.value().skipped_date_keys[0], "b:01/05/2025");
    EXPECT_FALSE(result.value().validation.warnings.empty());
}

TEST_F(MigrationOrchestratorTest, ObserverSeesEveryStep) {
    RecordingObserver observer;
    auto orchestrator = make(nullptr, &observer);
    ASSERT_TRUE(orchestrator.migrate().is_ok());

    ASSERT_FALSE(observer.percents.empty());
    for (std::size_t i = 1; i < observer.percents.size(); ++i) {
        EXPECT_LE(observer.percents[i - 1], observer.percents[i]);
    }
    EXPECT_EQ(observer.percents.back(), 100);
    EXPECT_TRUE(observer.errors.empty());
    ASSERT_EQ(observer.completed.size(), 1u);
    EXPECT_EQ(observer.completed[0].phase, MigrationPhase::Committed);
}

TEST_F(MigrationOrchestratorTest, ObserverSeesFailure) {
    RecordingObserver observer;
    store.fail_commit(true);
    auto orchestrator = make(nullptr, &observer);
    ASSERT_TRUE(orchestrator.migrate().is_error());

    ASSERT_EQ(observer.errors.size(), 1u);
    EXPECT_EQ(observer.errors[0].code, ErrorCode::CommitFailed);
    ASSERT_EQ(observer.completed.size(), 1u);
    EXPECT_FALSE(observer.completed[0].succeeded());
}

TEST_F(MigrationOrchestratorTest, EmitsEventsForMetrics) {
    events::EventBus bus;
    events::MetricsComponent metrics(bus);
    auto orchestrator = make(&bus);

    ASSERT_TRUE(orchestrator.migrate().is_ok());
    ASSERT_TRUE(orchestrator.migrate().is_error());

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.migrations_committed.load(), 1u);
    EXPECT_EQ(stats.migrations_failed.load(), 1u);
    EXPECT_EQ(stats.migrations_rolled_back.load(), 0u);

    ASSERT_TRUE(orchestrator.rollback(kUser).is_ok());
    EXPECT_EQ(stats.migrations_rolled_back.load(), 1u);
}
