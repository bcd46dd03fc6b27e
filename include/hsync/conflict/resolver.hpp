#pragma once

/**
 * @file resolver.hpp
 * @brief Field-level merge of two divergent copies of one habit
 *
 * For every registered field whose values differ, the highest-priority rule
 * picks the policy. The result always carries a fresh last_modified so that a
 * later comparison sees the merge as the newest copy.
 *
 * Resolution is pure: it never logs or touches a store. Configuration gaps
 * (fields without a rule, unknown custom resolvers) come back as diagnostics
 * and the caller decides how to surface them.
 */

#include "hsync/conflict/field_registry.hpp"
#include "hsync/conflict/field_rules.hpp"
#include "hsync/core/result.hpp"
#include "hsync/model/habit_record.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hsync::conflict {

enum class Winner {
    Local,
    Remote,
    Merged
};

struct FieldDecision {
    model::HabitField field;
    ResolutionPolicy policy;
    Winner winner;
    bool rule_missing = false;
};

struct ConflictResolutionResult {
    model::HabitRecord resolved;
    std::vector<FieldDecision> decisions;
    std::vector<std::string> missing_rules;
    std::vector<std::string> diagnostics;

    bool has_configuration_gaps() const { return !diagnostics.empty(); }
};

/**
 * Named resolver for Custom rules. Returns nullopt when it cannot handle the
 * value types it was given, in which case last-writer-wins applies.
 */
using CustomResolverFn = std::function<std::optional<FieldValue>(const FieldValue& local,
                                                                 const FieldValue& remote)>;

class CustomResolverRegistry {
public:
    /// Registry holding the built-in resolvers (resolveEndDate)
    static CustomResolverRegistry with_builtins();

    void register_resolver(const std::string& name, CustomResolverFn fn);
    bool contains(const std::string& name) const;
    const CustomResolverFn* find(const std::string& name) const;

private:
    std::map<std::string, CustomResolverFn> resolvers_;
};

class ConflictResolver {
public:
    explicit ConflictResolver(RuleTable rules = RuleTable(),
                              CustomResolverRegistry resolvers = CustomResolverRegistry::with_builtins());

    /**
     * Merge `local` and `remote`; the merged last_modified is one millisecond
     * past the newer input. Fails only when the two ids differ.
     */
    Result<ConflictResolutionResult> resolve(const model::HabitRecord& local,
                                             const model::HabitRecord& remote) const;

    /// As above, with last_modified = max(resolved_at, newer input + 1ms)
    Result<ConflictResolutionResult> resolve(const model::HabitRecord& local,
                                             const model::HabitRecord& remote,
                                             Timestamp resolved_at) const;

    const RuleTable& rules() const { return rules_; }
    const CustomResolverRegistry& resolvers() const { return resolvers_; }

private:
    RuleTable rules_;
    CustomResolverRegistry resolvers_;
};

/// Union of keys; the larger count wins for shared keys (never the sum)
model::DateCountMap merge_counts_max(const model::DateCountMap& a, const model::DateCountMap& b);

/**
 * Union of keys; shared keys get the integer mean, truncated toward zero.
 * (3 + 4) / 2 == 3.
 */
model::DateCountMap merge_ratings_mean(const model::DateCountMap& a, const model::DateCountMap& b);

/// Non-null beats null; with two dates the later one wins
std::optional<Date> resolve_end_date(const std::optional<Date>& a, const std::optional<Date>& b);

enum class ConflictType {
    Content,
    Data,
    Calculation,
    Timestamp
};

const char* to_string(ConflictType type) noexcept;

/// Transient divergence between two copies of one habit
struct ConflictRecord {
    std::string record_id;
    model::HabitRecord local;
    model::HabitRecord remote;
    ConflictType type = ConflictType::Timestamp;
    Timestamp detected_at{};
};

ConflictType classify(const model::HabitRecord& local, const model::HabitRecord& remote);

/// Pairs by id; a pair is a conflict when last_modified or content differs
std::vector<ConflictRecord> detect_conflicts(const std::vector<model::HabitRecord>& local,
                                             const std::vector<model::HabitRecord>& remote,
                                             Timestamp detected_at);

} // namespace hsync::conflict
