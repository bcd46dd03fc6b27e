// Included first on purpose: the header must compile on its own
#include "hsync/migration/memory_stores.hpp"

#include <gtest/gtest.h>

using namespace hsync;
using migration::InMemoryMigrationFlagStore;
using migration::InMemoryNormalizedStore;

TEST(InMemoryMigrationFlagStoreTest, LatchIsExclusivePerUser) {
    InMemoryMigrationFlagStore flags;
    EXPECT_TRUE(flags.try_acquire("user-1"));
    EXPECT_FALSE(flags.try_acquire("user-1"));
    EXPECT_TRUE(flags.try_acquire("user-2"));

    flags.release("user-1");
    EXPECT_TRUE(flags.try_acquire("user-1"));
}

TEST(InMemoryMigrationFlagStoreTest, CompletionAndInjectedFailure) {
    InMemoryMigrationFlagStore flags;
    const auto when = *parse_timestamp("2025-01-04 12:00:00");

    flags.fail_mark_completed(true);
    EXPECT_TRUE(flags.mark_completed("user-1", when).is_error());
    EXPECT_FALSE(flags.state("user-1").value().completed);

    flags.fail_mark_completed(false);
    ASSERT_TRUE(flags.mark_completed("user-1", when).is_ok());
    EXPECT_TRUE(flags.state("user-1").value().completed);

    ASSERT_TRUE(flags.clear("user-1").is_ok());
    EXPECT_FALSE(flags.state("user-1").value().completed);
}

TEST(InMemoryNormalizedStoreTest, RemovingAHabitTakesItsProgress) {
    InMemoryNormalizedStore store;

    migration::MigrationBatch batch;
    batch.user_id = "user-1";
    model::NormalizedHabit habit;
    habit.id = "h1";
    habit.user_id = "user-1";
    batch.habits.push_back(habit);
    model::DailyProgress progress;
    progress.id = "h1:2025-01-01";
    progress.habit_id = "h1";
    progress.date = *Date::parse("2025-01-01");
    batch.progress.push_back(progress);
    ASSERT_TRUE(store.commit(batch).is_ok());

    migration::RecordManifest manifest;
    manifest.user_id = "user-1";
    manifest.habit_ids = {"h1"};

    auto removed = store.remove(manifest);
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 2u);

    auto again = store.remove(manifest);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), 0u);
}
