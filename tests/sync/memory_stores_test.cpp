// Included first on purpose: the header must compile on its own
#include "hsync/sync/memory_stores.hpp"

#include <gtest/gtest.h>

using namespace hsync;
using namespace std::chrono_literals;
using sync::InMemoryLocalHabitStore;
using sync::InMemoryRemoteHabitStore;

namespace {

model::HabitRecord named(const std::string& id) {
    model::HabitRecord record;
    record.id = id;
    record.name = "Habit " + id;
    return record;
}

} // namespace

TEST(InMemoryRemoteHabitStoreTest, StampsMoveForwardOnAFrozenClock) {
    FixedClock clock{*Date::parse("2025-02-01")};
    InMemoryRemoteHabitStore remote(clock);

    remote.put_from_other_device(named("a"));
    remote.put_from_other_device(named("b"));
    const auto first = remote.get("a")->server_modified;
    const auto second = remote.get("b")->server_modified;
    EXPECT_GT(second, first);

    auto since_first = remote.fetch_changes_since(first);
    ASSERT_TRUE(since_first.is_ok());
    ASSERT_EQ(since_first.value().size(), 1u);
    EXPECT_EQ(since_first.value()[0].record.id, "b");

    auto everything = remote.fetch_changes_since(std::nullopt);
    ASSERT_TRUE(everything.is_ok());
    ASSERT_EQ(everything.value().size(), 2u);
    EXPECT_EQ(everything.value()[0].record.id, "a");
}

TEST(InMemoryRemoteHabitStoreTest, InjectedFailures) {
    FixedClock clock{*Date::parse("2025-02-01")};
    InMemoryRemoteHabitStore remote(clock);

    remote.fail_upserts_for("a");
    auto upserted = remote.upsert(named("a"));
    ASSERT_TRUE(upserted.is_error());
    EXPECT_EQ(upserted.error().code, ErrorCode::PersistFailed);
    EXPECT_TRUE(remote.upsert(named("b")).is_ok());

    remote.fail_fetch(true);
    EXPECT_TRUE(remote.fetch_changes_since(std::nullopt).is_error());

    remote.clear_failures();
    EXPECT_TRUE(remote.upsert(named("a")).is_ok());
    EXPECT_EQ(remote.fetch_calls(), 1u);
}

TEST(InMemoryLocalHabitStoreTest, PendingEditsUntilSynced) {
    InMemoryLocalHabitStore local;
    local.record_local_edit(named("a"));
    ASSERT_TRUE(local.save(named("b")).is_ok());

    auto pending = local.pending_changes();
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].id, "a");

    ASSERT_TRUE(local.mark_synced("a").is_ok());
    EXPECT_EQ(local.pending_count(), 0u);
    EXPECT_FALSE(local.checkpoint().has_value());

    local.fail_saves_for("c");
    EXPECT_TRUE(local.save(named("c")).is_error());
    EXPECT_TRUE(local.remove("missing").is_error());
}
