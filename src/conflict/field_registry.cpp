#include "hsync/conflict/field_registry.hpp"

#include <stdexcept>

namespace hsync::conflict {
namespace {

using model::HabitField;
using model::HabitRecord;

template<typename T>
FieldAccessor member(HabitField field, const char* name, T HabitRecord::*ptr,
                     MapSemantics semantics = MapSemantics::None) {
    FieldAccessor accessor;
    accessor.field = field;
    accessor.name = name;
    accessor.map_semantics = semantics;
    accessor.get = [ptr](const HabitRecord& record) -> FieldValue { return record.*ptr; };
    accessor.set = [ptr](HabitRecord& record, const FieldValue& value) { record.*ptr = std::get<T>(value); };
    return accessor;
}

// Integer fields travel as int64 so that FieldValue has one integral alternative
FieldAccessor int_member(HabitField field, const char* name, int HabitRecord::*ptr) {
    FieldAccessor accessor;
    accessor.field = field;
    accessor.name = name;
    accessor.get = [ptr](const HabitRecord& record) -> FieldValue {
        return static_cast<std::int64_t>(record.*ptr);
    };
    accessor.set = [ptr](HabitRecord& record, const FieldValue& value) {
        record.*ptr = static_cast<int>(std::get<std::int64_t>(value));
    };
    return accessor;
}

std::vector<FieldAccessor> build_registry() {
    std::vector<FieldAccessor> fields;
    fields.push_back(member(HabitField::Id, "id", &HabitRecord::id));
    fields.push_back(member(HabitField::Name, "name", &HabitRecord::name));
    fields.push_back(member(HabitField::Description, "description", &HabitRecord::description));
    fields.push_back(member(HabitField::Icon, "icon", &HabitRecord::icon));
    fields.push_back(member(HabitField::Color, "color", &HabitRecord::color));
    fields.push_back(member(HabitField::HabitType, "habitType", &HabitRecord::habit_type));
    fields.push_back(member(HabitField::Schedule, "schedule", &HabitRecord::schedule));
    fields.push_back(member(HabitField::Goal, "goal", &HabitRecord::goal));
    fields.push_back(member(HabitField::Reminder, "reminder", &HabitRecord::reminder));
    fields.push_back(member(HabitField::StartDate, "startDate", &HabitRecord::start_date));
    fields.push_back(member(HabitField::EndDate, "endDate", &HabitRecord::end_date));
    fields.push_back(member(HabitField::CreatedAt, "createdAt", &HabitRecord::created_at));
    fields.push_back(int_member(HabitField::Baseline, "baseline", &HabitRecord::baseline));
    fields.push_back(int_member(HabitField::Target, "target", &HabitRecord::target));
    fields.push_back(member(HabitField::CompletionHistory, "completionHistory",
                            &HabitRecord::completion_history, MapSemantics::Count));
    fields.push_back(member(HabitField::DifficultyHistory, "difficultyHistory",
                            &HabitRecord::difficulty_history, MapSemantics::Rating));
    fields.push_back(member(HabitField::ActualUsage, "actualUsage",
                            &HabitRecord::actual_usage, MapSemantics::Count));
    fields.push_back(member(HabitField::IsDeleted, "isDeleted", &HabitRecord::is_deleted));
    return fields;
}

} // namespace

const std::vector<FieldAccessor>& habit_fields() {
    static const std::vector<FieldAccessor> fields = build_registry();
    return fields;
}

const FieldAccessor& accessor_for(model::HabitField field) {
    for (const auto& accessor : habit_fields()) {
        if (accessor.field == field) {
            return accessor;
        }
    }
    throw std::out_of_range("No accessor registered for habit field");
}

const char* field_name(model::HabitField field) {
    return accessor_for(field).name.c_str();
}

std::optional<model::HabitField> field_from_name(std::string_view name) {
    for (const auto& accessor : habit_fields()) {
        if (accessor.name == name) {
            return accessor.field;
        }
    }
    return std::nullopt;
}

} // namespace hsync::conflict
