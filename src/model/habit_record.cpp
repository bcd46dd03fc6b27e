#include "hsync/model/habit_record.hpp"

#include <tuple>

namespace hsync::model {
namespace {

auto content_tie(const HabitRecord& r) {
    return std::tie(r.id, r.name, r.description, r.icon, r.color, r.habit_type,
                    r.schedule, r.goal, r.reminder, r.start_date, r.end_date,
                    r.created_at, r.baseline, r.target, r.completion_history,
                    r.difficulty_history, r.actual_usage, r.is_deleted);
}

} // namespace

bool HabitRecord::content_equals(const HabitRecord& other) const {
    return content_tie(*this) == content_tie(other);
}

bool operator==(const HabitRecord& lhs, const HabitRecord& rhs) {
    return lhs.content_equals(rhs) &&
           lhs.last_modified == rhs.last_modified &&
           lhs.field_modified == rhs.field_modified;
}

std::string HabitTypeUtils::to_string(HabitType type) {
    switch (type) {
        case HabitType::Formation: return "formation";
        case HabitType::Breaking: return "breaking";
    }
    return "formation";
}

std::optional<HabitType> HabitTypeUtils::from_string(const std::string& text) {
    if (text == "formation") return HabitType::Formation;
    if (text == "breaking") return HabitType::Breaking;
    return std::nullopt;
}

} // namespace hsync::model
