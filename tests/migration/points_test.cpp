#include "hsync/migration/points.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace hsync;
using migration::LegacyPointEntry;
using migration::LegacyPointsSnapshot;
using migration::migrate_points;

namespace {

const Timestamp kMigratedAt = *parse_timestamp("2025-03-01 12:00:00");

} // namespace

TEST(LevelTest, LevelsCostIncreasingPoints) {
    EXPECT_EQ(model::level_for_points(0), 1);
    EXPECT_EQ(model::level_for_points(999), 1);
    EXPECT_EQ(model::level_for_points(1000), 2);
    EXPECT_EQ(model::level_for_points(2999), 2);
    EXPECT_EQ(model::level_for_points(3000), 3);
    EXPECT_EQ(model::level_for_points(-50), 1);
    EXPECT_EQ(model::cumulative_points_for_level(3), 3000);
}

TEST(LevelTest, HugeTotalsStayExact) {
    const std::int64_t at_level = model::cumulative_points_for_level(100000);
    EXPECT_EQ(model::level_for_points(at_level), 100000);
    EXPECT_EQ(model::level_for_points(at_level - 1), 99999);

    const std::int64_t max_total = std::numeric_limits<std::int64_t>::max();
    const int level = model::level_for_points(max_total);
    ASSERT_GT(level, 1);
    EXPECT_LE(model::cumulative_points_for_level(level), max_total);
    const auto next = static_cast<std::int64_t>(level);
    EXPECT_GT(next * (next + 1), max_total / 500);
}

TEST(PointsMigrationTest, SynthesizesSingleTransactionWithoutHistory) {
    LegacyPointsSnapshot legacy;
    legacy.total_points = 1500;

    auto out = migrate_points(legacy, "user-1", kMigratedAt);
    EXPECT_TRUE(out.synthesized_initial);
    EXPECT_FALSE(out.balance_adjusted);
    ASSERT_EQ(out.progress.transactions.size(), 1u);

    const auto& txn = out.progress.transactions[0];
    EXPECT_EQ(txn.amount, 1500);
    EXPECT_EQ(txn.reason, "Initial migration");
    EXPECT_EQ(txn.timestamp, kMigratedAt);
    EXPECT_EQ(txn.user_id, "user-1");

    EXPECT_EQ(out.progress.total_points, 1500);
    EXPECT_EQ(out.progress.level, 2);
    EXPECT_EQ(out.progress.points_into_level(), 500);
    EXPECT_EQ(out.progress.points_for_next_level(), 2000);
}

TEST(PointsMigrationTest, ZeroBalanceStillGetsInitialTransaction) {
    auto out = migrate_points(LegacyPointsSnapshot{}, "user-1", kMigratedAt);
    ASSERT_EQ(out.progress.transactions.size(), 1u);
    EXPECT_EQ(out.progress.transactions[0].amount, 0);
    EXPECT_EQ(out.progress.level, 1);
}

TEST(PointsMigrationTest, KeepsHistoryThatAddsUp) {
    LegacyPointsSnapshot legacy;
    legacy.total_points = 300;
    legacy.history = {
        LegacyPointEntry{"2025-01-01 09:00:00", 100, "Completed Read"},
        LegacyPointEntry{"2025-01-02", 200, "Streak bonus"},
    };

    auto out = migrate_points(legacy, "user-1", kMigratedAt);
    EXPECT_FALSE(out.synthesized_initial);
    EXPECT_FALSE(out.balance_adjusted);
    ASSERT_EQ(out.progress.transactions.size(), 2u);
    EXPECT_EQ(out.progress.transactions[1].reason, "Streak bonus");
    EXPECT_EQ(out.progress.ledger_sum(), 300);
    EXPECT_NE(out.progress.transactions[0].id, out.progress.transactions[1].id);
}

TEST(PointsMigrationTest, AppendsBalanceAdjustment) {
    LegacyPointsSnapshot legacy;
    legacy.total_points = 1000;
    legacy.history = {
        LegacyPointEntry{"2025-01-01 09:00:00", 400, "Completed Read"},
        LegacyPointEntry{"2025-01-02 09:00:00", 500, "Completed Run"},
    };

    auto out = migrate_points(legacy, "user-1", kMigratedAt);
    EXPECT_TRUE(out.balance_adjusted);
    ASSERT_EQ(out.progress.transactions.size(), 3u);
    EXPECT_EQ(out.progress.transactions[2].amount, 100);
    EXPECT_EQ(out.progress.transactions[2].reason, "Migration balance adjustment");
    EXPECT_EQ(out.progress.total_points, 1000);
    EXPECT_EQ(out.progress.ledger_sum(), out.progress.total_points);
}

TEST(PointsMigrationTest, SkipsUnreadableEntriesAndStillConserves) {
    LegacyPointsSnapshot legacy;
    legacy.total_points = 500;
    legacy.history = {
        LegacyPointEntry{"2025-01-01 09:00:00", 200, "Completed Read"},
        LegacyPointEntry{"sometime last week", 300, "Completed Run"},
    };

    auto out = migrate_points(legacy, "user-1", kMigratedAt);
    EXPECT_EQ(out.skipped_entries, 1u);
    EXPECT_TRUE(out.balance_adjusted);
    EXPECT_EQ(out.progress.total_points, 500);
    EXPECT_EQ(out.progress.ledger_sum(), 500);
}

TEST(PointsMigrationTest, StoredLevelIsRederived) {
    LegacyPointsSnapshot legacy;
    legacy.total_points = 3500;
    legacy.stored_level = 7;

    auto out = migrate_points(legacy, "user-1", kMigratedAt);
    EXPECT_EQ(out.progress.level, 3);
    EXPECT_EQ(out.ignored_stored_level, 7);
}
