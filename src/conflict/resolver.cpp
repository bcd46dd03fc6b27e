#include "hsync/conflict/resolver.hpp"

#include <algorithm>
#include <chrono>

namespace hsync::conflict {
namespace {

using model::HabitField;
using model::HabitRecord;

std::optional<Timestamp> stamp_of(const HabitRecord& record, HabitField field) {
    auto it = record.field_modified.find(field);
    if (it == record.field_modified.end()) {
        return std::nullopt;
    }
    return it->second;
}

void apply_stamp(HabitRecord& record, HabitField field, const std::optional<Timestamp>& stamp) {
    if (stamp) {
        record.field_modified[field] = *stamp;
    } else {
        record.field_modified.erase(field);
    }
}

std::optional<Timestamp> newer_stamp(const std::optional<Timestamp>& a, const std::optional<Timestamp>& b) {
    if (!a) return b;
    if (!b) return a;
    return std::max(*a, *b);
}

// Remote clock is authoritative, so a tie goes to the remote copy
Winner last_writer(const HabitRecord& local, const HabitRecord& remote, HabitField field) {
    return local.field_clock(field) > remote.field_clock(field) ? Winner::Local : Winner::Remote;
}

Winner first_writer(const HabitRecord& local, const HabitRecord& remote) {
    return local.created_at < remote.created_at ? Winner::Local : Winner::Remote;
}

std::optional<FieldValue> merge_maps(const FieldAccessor& accessor,
                                     const FieldValue& local,
                                     const FieldValue& remote) {
    const auto* a = std::get_if<model::DateCountMap>(&local);
    const auto* b = std::get_if<model::DateCountMap>(&remote);
    if (a == nullptr || b == nullptr) {
        return std::nullopt;
    }
    switch (accessor.map_semantics) {
        case MapSemantics::Count: return FieldValue(merge_counts_max(*a, *b));
        case MapSemantics::Rating: return FieldValue(merge_ratings_mean(*a, *b));
        case MapSemantics::None: break;
    }
    return std::nullopt;
}

} // namespace

CustomResolverRegistry CustomResolverRegistry::with_builtins() {
    CustomResolverRegistry registry;
    registry.register_resolver("resolveEndDate",
        [](const FieldValue& local, const FieldValue& remote) -> std::optional<FieldValue> {
            const auto* a = std::get_if<std::optional<Date>>(&local);
            const auto* b = std::get_if<std::optional<Date>>(&remote);
            if (a == nullptr || b == nullptr) {
                return std::nullopt;
            }
            return FieldValue(resolve_end_date(*a, *b));
        });
    return registry;
}

void CustomResolverRegistry::register_resolver(const std::string& name, CustomResolverFn fn) {
    resolvers_[name] = std::move(fn);
}

bool CustomResolverRegistry::contains(const std::string& name) const {
    return resolvers_.count(name) > 0;
}

const CustomResolverFn* CustomResolverRegistry::find(const std::string& name) const {
    auto it = resolvers_.find(name);
    return it == resolvers_.end() ? nullptr : &it->second;
}

ConflictResolver::ConflictResolver(RuleTable rules, CustomResolverRegistry resolvers)
    : rules_(std::move(rules)), resolvers_(std::move(resolvers)) {}

Result<ConflictResolutionResult> ConflictResolver::resolve(const HabitRecord& local,
                                                           const HabitRecord& remote) const {
    return resolve(local, remote, Timestamp{});
}

Result<ConflictResolutionResult> ConflictResolver::resolve(const HabitRecord& local,
                                                           const HabitRecord& remote,
                                                           Timestamp resolved_at) const {
    if (local.id != remote.id) {
        return Err<ConflictResolutionResult>(ErrorCode::IdentityMismatch,
                                             "Cannot resolve records with different ids: " +
                                             local.id + " vs " + remote.id);
    }

    ConflictResolutionResult result;
    result.resolved = local;
    HabitRecord& out = result.resolved;

    for (const auto& accessor : habit_fields()) {
        const FieldValue local_value = accessor.get(local);
        const FieldValue remote_value = accessor.get(remote);
        const auto local_stamp = stamp_of(local, accessor.field);
        const auto remote_stamp = stamp_of(remote, accessor.field);

        if (local_value == remote_value) {
            apply_stamp(out, accessor.field, newer_stamp(local_stamp, remote_stamp));
            continue;
        }

        FieldDecision decision{accessor.field, ResolutionPolicy::LastWriterWins, Winner::Remote, false};
        auto rule = rules_.rule_for(accessor.name);
        if (!rule) {
            decision.rule_missing = true;
            result.missing_rules.push_back(accessor.name);
            result.diagnostics.push_back("No conflict rule for field " + accessor.name +
                                         "; using last_writer_wins");
        } else {
            decision.policy = rule->policy;
        }

        std::optional<FieldValue> merged;
        switch (decision.policy) {
            case ResolutionPolicy::LastWriterWins:
                decision.winner = last_writer(local, remote, accessor.field);
                break;
            case ResolutionPolicy::FirstWriterWins:
                decision.winner = first_writer(local, remote);
                break;
            case ResolutionPolicy::Merge:
                merged = merge_maps(accessor, local_value, remote_value);
                if (!merged) {
                    result.diagnostics.push_back("Field " + accessor.name +
                                                 " has no merge semantics; using last_writer_wins");
                }
                break;
            case ResolutionPolicy::Custom: {
                const std::string name = rule->custom_resolver.value_or("");
                const auto* fn = resolvers_.find(name);
                if (fn == nullptr) {
                    result.diagnostics.push_back("Unknown custom resolver '" + name + "' for field " +
                                                 accessor.name + "; using last_writer_wins");
                } else {
                    merged = (*fn)(local_value, remote_value);
                    if (!merged) {
                        result.diagnostics.push_back("Custom resolver '" + name + "' cannot handle field " +
                                                     accessor.name + "; using last_writer_wins");
                    }
                }
                break;
            }
        }

        if (merged) {
            decision.winner = Winner::Merged;
            accessor.set(out, *merged);
            apply_stamp(out, accessor.field, newer_stamp(local_stamp, remote_stamp));
        } else {
            if (decision.policy == ResolutionPolicy::Merge || decision.policy == ResolutionPolicy::Custom) {
                decision.winner = last_writer(local, remote, accessor.field);
            }
            if (decision.winner == Winner::Remote) {
                accessor.set(out, remote_value);
                apply_stamp(out, accessor.field, remote_stamp);
            } else {
                apply_stamp(out, accessor.field, local_stamp);
            }
        }
        result.decisions.push_back(decision);
    }

    const Timestamp newest = std::max(local.last_modified, remote.last_modified);
    out.last_modified = std::max(resolved_at, newest + std::chrono::milliseconds(1));
    return Ok(std::move(result));
}

model::DateCountMap merge_counts_max(const model::DateCountMap& a, const model::DateCountMap& b) {
    model::DateCountMap merged = a;
    for (const auto& [key, count] : b) {
        auto it = merged.find(key);
        if (it == merged.end()) {
            merged.emplace(key, count);
        } else {
            it->second = std::max(it->second, count);
        }
    }
    return merged;
}

model::DateCountMap merge_ratings_mean(const model::DateCountMap& a, const model::DateCountMap& b) {
    model::DateCountMap merged = a;
    for (const auto& [key, rating] : b) {
        auto it = merged.find(key);
        if (it == merged.end()) {
            merged.emplace(key, rating);
        } else {
            // Integer division truncates toward zero: (3 + 4) / 2 == 3
            it->second = (it->second + rating) / 2;
        }
    }
    return merged;
}

std::optional<Date> resolve_end_date(const std::optional<Date>& a, const std::optional<Date>& b) {
    if (!a) return b;
    if (!b) return a;
    return std::max(*a, *b);
}

const char* to_string(ConflictType type) noexcept {
    switch (type) {
        case ConflictType::Content: return "content";
        case ConflictType::Data: return "data";
        case ConflictType::Calculation: return "calculation";
        case ConflictType::Timestamp: return "timestamp";
    }
    return "timestamp";
}

ConflictType classify(const HabitRecord& local, const HabitRecord& remote) {
    if (local.name != remote.name || local.description != remote.description) {
        return ConflictType::Content;
    }
    if (local.completion_history != remote.completion_history) {
        return ConflictType::Data;
    }
    if (local.baseline != remote.baseline || local.target != remote.target) {
        return ConflictType::Calculation;
    }
    return ConflictType::Timestamp;
}

std::vector<ConflictRecord> detect_conflicts(const std::vector<HabitRecord>& local,
                                             const std::vector<HabitRecord>& remote,
                                             Timestamp detected_at) {
    std::map<std::string, const HabitRecord*> remote_by_id;
    for (const auto& record : remote) {
        remote_by_id[record.id] = &record;
    }

    std::vector<ConflictRecord> conflicts;
    for (const auto& mine : local) {
        auto it = remote_by_id.find(mine.id);
        if (it == remote_by_id.end()) {
            continue;
        }
        const HabitRecord& theirs = *it->second;
        if (mine.last_modified != theirs.last_modified || !mine.content_equals(theirs)) {
            conflicts.push_back(ConflictRecord{mine.id, mine, theirs, classify(mine, theirs), detected_at});
        }
    }
    return conflicts;
}

} // namespace hsync::conflict
