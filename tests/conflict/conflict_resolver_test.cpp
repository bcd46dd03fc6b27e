#include "hsync/conflict/resolver.hpp"

#include <gtest/gtest.h>

#include <random>

using namespace hsync;
using namespace std::chrono_literals;
using conflict::ConflictResolver;
using conflict::FieldConflictRule;
using conflict::ResolutionPolicy;
using conflict::RuleTable;
using model::HabitField;
using model::HabitRecord;

namespace {

Timestamp at(const char* text) {
    return *parse_timestamp(text);
}

HabitRecord base_habit() {
    HabitRecord record;
    record.id = "habit-1";
    record.name = "Read";
    record.goal = "5 times";
    record.schedule = "Everyday";
    record.start_date = *Date::parse("2025-01-01");
    record.created_at = at("2025-01-01 08:00:00");
    record.last_modified = at("2025-01-01 08:00:00");
    return record;
}

const conflict::FieldDecision* decision_for(const conflict::ConflictResolutionResult& result, HabitField field) {
    for (const auto& decision : result.decisions) {
        if (decision.field == field) {
            return &decision;
        }
    }
    return nullptr;
}

HabitRecord random_habit(std::mt19937& rng, const std::string& id) {
    static const std::vector<std::string> names = {"Read", "Run", "Meditate", "Journal"};
    static const std::vector<std::string> schedules = {"Everyday", "Weekdays", "3 days a week", "Mon, Wed"};
    std::uniform_int_distribution<int> pick(0, 3);
    std::uniform_int_distribution<int> count(0, 9);
    std::uniform_int_distribution<int> day(1, 20);
    std::uniform_int_distribution<int> minutes(0, 10000);

    HabitRecord record;
    record.id = id;
    record.name = names[pick(rng)];
    record.schedule = schedules[pick(rng)];
    record.goal = std::to_string(count(rng) + 1) + " times";
    record.habit_type = pick(rng) == 0 ? model::HabitType::Breaking : model::HabitType::Formation;
    record.start_date = *Date::from_ymd(2025, 1, static_cast<unsigned>(day(rng)));
    if (pick(rng) < 2) {
        record.end_date = Date::from_ymd(2025, 6, static_cast<unsigned>(day(rng)));
    }
    record.created_at = at("2025-01-01 00:00:00") + std::chrono::minutes(minutes(rng));
    record.last_modified = record.created_at + std::chrono::minutes(minutes(rng));
    record.baseline = count(rng);
    record.target = count(rng);
    record.is_deleted = pick(rng) == 0;

    for (int i = 0; i < 5; ++i) {
        const auto key = Date::from_ymd(2025, 2, static_cast<unsigned>(day(rng)))->to_string();
        record.completion_history[key] = count(rng);
        record.difficulty_history[key] = count(rng) + 1;
        record.actual_usage[key] = count(rng);
    }
    if (pick(rng) == 0) {
        record.touch(HabitField::Name, record.last_modified + std::chrono::minutes(minutes(rng)));
    }
    return record;
}

} // namespace

TEST(ConflictResolverTest, FieldsResolveIndependently) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();

    // Local renamed the habit at 10:00, remote changed the schedule at 11:00
    local.name = "Read before bed";
    local.touch(HabitField::Name, at("2025-01-02 10:00:00"));
    local.field_modified[HabitField::Schedule] = at("2025-01-01 08:00:00");

    remote.schedule = "Weekdays";
    remote.touch(HabitField::Schedule, at("2025-01-02 11:00:00"));
    remote.field_modified[HabitField::Name] = at("2025-01-01 08:00:00");

    ConflictResolver resolver;
    auto result = resolver.resolve(local, remote);
    ASSERT_TRUE(result.is_ok());

    const auto& resolved = result.value().resolved;
    EXPECT_EQ(resolved.name, "Read before bed");
    EXPECT_EQ(resolved.schedule, "Weekdays");
    EXPECT_EQ(decision_for(result.value(), HabitField::Name)->winner, conflict::Winner::Local);
    EXPECT_EQ(decision_for(result.value(), HabitField::Schedule)->winner, conflict::Winner::Remote);
    EXPECT_EQ(resolved.field_clock(HabitField::Name), at("2025-01-02 10:00:00"));
    EXPECT_EQ(resolved.field_clock(HabitField::Schedule), at("2025-01-02 11:00:00"));
}

TEST(ConflictResolverTest, CompletionMergeTakesMaximumNotSum) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    local.completion_history = {{"2025-01-01", 2}, {"2025-01-02", 1}};
    remote.completion_history = {{"2025-01-01", 5}, {"2025-01-03", 4}};

    auto result = ConflictResolver().resolve(local, remote);
    ASSERT_TRUE(result.is_ok());

    const model::DateCountMap expected = {{"2025-01-01", 5}, {"2025-01-02", 1}, {"2025-01-03", 4}};
    EXPECT_EQ(result.value().resolved.completion_history, expected);
    EXPECT_EQ(decision_for(result.value(), HabitField::CompletionHistory)->winner, conflict::Winner::Merged);
}

TEST(ConflictResolverTest, UsageMergeTakesMaximum) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    local.habit_type = remote.habit_type = model::HabitType::Breaking;
    local.actual_usage = {{"2025-01-01", 3}};
    remote.actual_usage = {{"2025-01-01", 2}};

    auto result = ConflictResolver().resolve(local, remote);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().resolved.actual_usage.at("2025-01-01"), 3);
}

TEST(ConflictResolverTest, DifficultyMergeTruncatesMean) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    local.difficulty_history = {{"2025-01-01", 3}, {"2025-01-02", 8}};
    remote.difficulty_history = {{"2025-01-01", 4}, {"2025-01-03", 6}};

    auto result = ConflictResolver().resolve(local, remote);
    ASSERT_TRUE(result.is_ok());

    const model::DateCountMap expected = {{"2025-01-01", 3}, {"2025-01-02", 8}, {"2025-01-03", 6}};
    EXPECT_EQ(result.value().resolved.difficulty_history, expected);
}

TEST(ConflictResolverTest, EndDatePrefersSetThenLater) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    remote.end_date = Date::parse("2025-06-30");
    remote.last_modified = at("2024-12-31 00:00:00");   // older, still wins: non-null beats null

    auto result = ConflictResolver().resolve(local, remote);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().resolved.end_date, Date::parse("2025-06-30"));

    local.end_date = Date::parse("2025-09-01");
    result = ConflictResolver().resolve(local, remote);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().resolved.end_date, Date::parse("2025-09-01"));
    EXPECT_EQ(decision_for(result.value(), HabitField::EndDate)->winner, conflict::Winner::Merged);
}

TEST(ConflictResolverTest, StartDateKeepsFirstWriter) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    local.created_at = at("2024-12-01 00:00:00");
    local.start_date = *Date::parse("2024-12-01");
    remote.start_date = *Date::parse("2025-02-01");
    remote.last_modified = at("2025-03-01 00:00:00");

    auto result = ConflictResolver().resolve(local, remote);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().resolved.start_date.to_string(), "2024-12-01");
}

TEST(ConflictResolverTest, LastWriterTieGoesToRemote) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    local.color = "red";
    remote.color = "blue";

    auto result = ConflictResolver().resolve(local, remote);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().resolved.color, "blue");
}

TEST(ConflictResolverTest, MissingRuleFallsBackToLastWriterWins) {
    std::vector<FieldConflictRule> defaults;
    for (const auto& rule : RuleTable::default_rules()) {
        if (rule.field_name != "color") {
            defaults.push_back(rule);
        }
    }
    ConflictResolver resolver(RuleTable(defaults, {}));

    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    local.color = "red";
    local.last_modified = at("2025-01-05 00:00:00");
    remote.color = "blue";

    auto result = resolver.resolve(local, remote);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().resolved.color, "red");
    ASSERT_EQ(result.value().missing_rules.size(), 1u);
    EXPECT_EQ(result.value().missing_rules[0], "color");
    EXPECT_TRUE(result.value().has_configuration_gaps());
    EXPECT_TRUE(decision_for(result.value(), HabitField::Color)->rule_missing);
}

TEST(ConflictResolverTest, UnknownCustomResolverFallsBackWithDiagnostic) {
    ConflictResolver resolver(RuleTable().with_extension(
        {"endDate", ResolutionPolicy::Custom, 99, std::string("resolveByMagic")}));

    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    local.end_date = Date::parse("2025-09-01");
    remote.end_date = Date::parse("2025-06-30");
    remote.last_modified = at("2025-02-01 00:00:00");

    auto result = resolver.resolve(local, remote);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().resolved.end_date, Date::parse("2025-06-30"));
    EXPECT_TRUE(result.value().missing_rules.empty());
    ASSERT_EQ(result.value().diagnostics.size(), 1u);
    EXPECT_NE(result.value().diagnostics[0].find("resolveByMagic"), std::string::npos);
}

TEST(ConflictResolverTest, RegisteredCustomResolverIsUsed) {
    auto registry = conflict::CustomResolverRegistry::with_builtins();
    registry.register_resolver("longestName",
        [](const conflict::FieldValue& a, const conflict::FieldValue& b) -> std::optional<conflict::FieldValue> {
            const auto* x = std::get_if<std::string>(&a);
            const auto* y = std::get_if<std::string>(&b);
            if (x == nullptr || y == nullptr) {
                return std::nullopt;
            }
            return conflict::FieldValue(x->size() >= y->size() ? *x : *y);
        });
    ConflictResolver resolver(RuleTable().with_extension(
        {"name", ResolutionPolicy::Custom, 200, std::string("longestName")}), registry);

    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    local.name = "Read a chapter";
    remote.name = "Read!";
    remote.last_modified = at("2025-02-01 00:00:00");

    auto result = resolver.resolve(local, remote);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().resolved.name, "Read a chapter");
    EXPECT_FALSE(result.value().has_configuration_gaps());
}

TEST(ConflictResolverTest, ResultCarriesFreshTimestamp) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    remote.last_modified = at("2025-01-03 00:00:00");
    remote.name = "Run";

    ConflictResolver resolver;
    auto plain = resolver.resolve(local, remote);
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value().resolved.last_modified, remote.last_modified + 1ms);

    const auto now = at("2025-01-10 00:00:00");
    auto stamped = resolver.resolve(local, remote, now);
    ASSERT_TRUE(stamped.is_ok());
    EXPECT_EQ(stamped.value().resolved.last_modified, now);

    auto skewed = resolver.resolve(local, remote, at("2020-01-01 00:00:00"));
    ASSERT_TRUE(skewed.is_ok());
    EXPECT_GT(skewed.value().resolved.last_modified, remote.last_modified);
}

TEST(ConflictResolverTest, RejectsDifferentIds) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    remote.id = "habit-2";

    auto result = ConflictResolver().resolve(local, remote);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::IdentityMismatch);
}

TEST(ConflictResolverTest, ResolutionIsIdempotent) {
    std::mt19937 rng(20250101);
    ConflictResolver resolver;

    for (int i = 0; i < 200; ++i) {
        HabitRecord a = random_habit(rng, "habit-" + std::to_string(i));
        HabitRecord b = random_habit(rng, a.id);

        auto merged = resolver.resolve(a, b);
        ASSERT_TRUE(merged.is_ok());
        const HabitRecord& m = merged.value().resolved;

        auto again = resolver.resolve(m, m);
        ASSERT_TRUE(again.is_ok());
        EXPECT_TRUE(again.value().resolved.content_equals(m)) << "iteration " << i;
        EXPECT_TRUE(again.value().decisions.empty());
        EXPECT_EQ(again.value().resolved.field_modified, m.field_modified);
        EXPECT_GT(again.value().resolved.last_modified, m.last_modified);
    }
}

TEST(ConflictResolverTest, ResolutionIsDeterministic) {
    std::mt19937 rng(7);
    ConflictResolver resolver;

    for (int i = 0; i < 50; ++i) {
        HabitRecord a = random_habit(rng, "habit");
        HabitRecord b = random_habit(rng, "habit");
        auto first = resolver.resolve(a, b);
        auto second = resolver.resolve(a, b);
        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(second.is_ok());
        EXPECT_EQ(first.value().resolved, second.value().resolved);
    }
}

TEST(ConflictDetectionTest, ClassifiesByWhatDiffers) {
    HabitRecord local = base_habit();
    HabitRecord remote = base_habit();
    EXPECT_EQ(conflict::classify(local, remote), conflict::ConflictType::Timestamp);

    remote.target = 3;
    EXPECT_EQ(conflict::classify(local, remote), conflict::ConflictType::Calculation);

    remote.completion_history["2025-01-01"] = 1;
    EXPECT_EQ(conflict::classify(local, remote), conflict::ConflictType::Data);

    remote.name = "Run";
    EXPECT_EQ(conflict::classify(local, remote), conflict::ConflictType::Content);
}

TEST(ConflictDetectionTest, PairsRecordsById) {
    HabitRecord same = base_habit();
    HabitRecord changed = base_habit();
    changed.id = "habit-2";
    HabitRecord changed_remote = changed;
    changed_remote.name = "Run";
    HabitRecord local_only = base_habit();
    local_only.id = "habit-3";

    const auto detected_at = at("2025-01-05 12:00:00");
    auto conflicts = conflict::detect_conflicts({same, changed, local_only}, {same, changed_remote}, detected_at);

    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].record_id, "habit-2");
    EXPECT_EQ(conflicts[0].type, conflict::ConflictType::Content);
    EXPECT_EQ(conflicts[0].detected_at, detected_at);
}
