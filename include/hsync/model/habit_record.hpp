#pragma once

/**
 * @file habit_record.hpp
 * @brief Flat habit record shared by the legacy schema and the sync path
 *
 * WHY THIS FILE EXISTS:
 * Both the local store and the remote store exchange habits in the same
 * flat, denormalized shape: display metadata, a free-text goal and schedule,
 * and three date-keyed history maps. The migration reads the same shape from
 * the legacy persistence layer.
 *
 * DESIGN DECISIONS:
 * - Plain struct, value semantics: records are copied into merge results and
 *   never shared by reference between stores
 * - std::map for history maps: deterministic iteration order, which keeps
 *   merge output and JSON dumps stable
 * - Optional per-field modification stamps: the last-writer-wins clock is
 *   tracked per field so that two devices editing different fields both keep
 *   their edit
 */

#include "hsync/core/date.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace hsync {
namespace model {

/// Date key ("yyyy-MM-dd") -> count or rating
using DateCountMap = std::map<std::string, int>;

enum class HabitType {
    Formation,  // build a habit: progress >= goal completes the day
    Breaking    // reduce a habit: usage <= goal completes the day
};

/**
 * @brief Identifier for every attribute of a HabitRecord
 *
 * Conflict detection iterates all fields generically through the field
 * registry (conflict/field_registry.hpp) keyed by these values.
 */
enum class HabitField {
    Id,
    Name,
    Description,
    Icon,
    Color,
    HabitType,
    Schedule,
    Goal,
    Reminder,
    StartDate,
    EndDate,
    CreatedAt,
    Baseline,
    Target,
    CompletionHistory,
    DifficultyHistory,
    ActualUsage,
    IsDeleted
};

using FieldStamps = std::map<HabitField, Timestamp>;

/**
 * @brief One habit as stored by the legacy layer and the sync stores
 *
 * EXAMPLE:
 *   id        "6f1c..."
 *   goal      "5 times"
 *   schedule  "3 days a week"
 *   completion_history {"2025-01-01": 5, "2025-01-02": 3}
 */
struct HabitRecord {
    std::string id;
    std::string name;
    std::string description;
    std::string icon;
    std::string color;
    HabitType habit_type = HabitType::Formation;

    std::string schedule;   // legacy free text, e.g. "Everyday"
    std::string goal;       // legacy free text, e.g. "30 minutes"
    std::string reminder;

    Date start_date;
    std::optional<Date> end_date;
    Timestamp created_at{};

    int baseline = 0;   // breaking habits: usage before starting
    int target = 0;     // breaking habits: usage aimed for

    DateCountMap completion_history;
    DateCountMap difficulty_history;   // 1-10 ratings
    DateCountMap actual_usage;         // breaking habits only

    Timestamp last_modified{};
    bool is_deleted = false;

    FieldStamps field_modified;

    /**
     * Clock used for last-writer-wins on one field: the field's own stamp
     * when present, otherwise the record-level last_modified.
     */
    Timestamp field_clock(HabitField field) const {
        auto it = field_modified.find(field);
        return it != field_modified.end() ? it->second : last_modified;
    }

    /// Record an edit of one field at `when`
    void touch(HabitField field, Timestamp when) {
        field_modified[field] = when;
        if (when > last_modified) {
            last_modified = when;
        }
    }

    bool is_newer_than(const HabitRecord& other) const {
        return last_modified > other.last_modified;
    }

    /// The history map that feeds progress for this habit's type
    const DateCountMap& progress_history() const {
        return habit_type == HabitType::Breaking ? actual_usage : completion_history;
    }

    /// Equality of every user-visible field, ignoring modification stamps
    bool content_equals(const HabitRecord& other) const;
};

bool operator==(const HabitRecord& lhs, const HabitRecord& rhs);
inline bool operator!=(const HabitRecord& lhs, const HabitRecord& rhs) { return !(lhs == rhs); }

class HabitTypeUtils {
public:
    static std::string to_string(HabitType type);
    static std::optional<HabitType> from_string(const std::string& text);
};

} // namespace model
} // namespace hsync
