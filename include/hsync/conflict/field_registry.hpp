#pragma once

#include "hsync/core/date.hpp"
#include "hsync/model/habit_record.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hsync::conflict {

/// Value of any HabitRecord field, as seen by the resolver
using FieldValue = std::variant<std::string,
                                std::int64_t,
                                bool,
                                Date,
                                std::optional<Date>,
                                Timestamp,
                                model::HabitType,
                                model::DateCountMap>;

/// How a Merge rule combines two history maps
enum class MapSemantics {
    None,    // not a map; merge falls back to last-writer-wins
    Count,   // per-key maximum
    Rating   // per-key mean
};

/**
 * @brief Typed getter/setter pair for one HabitRecord field
 *
 * The registry replaces runtime reflection: conflict detection walks every
 * accessor and compares values without knowing the concrete field types.
 */
struct FieldAccessor {
    model::HabitField field;
    std::string name;   // rule-table name, e.g. "completionHistory"
    MapSemantics map_semantics = MapSemantics::None;
    std::function<FieldValue(const model::HabitRecord&)> get;
    std::function<void(model::HabitRecord&, const FieldValue&)> set;
};

/// Every HabitRecord field in declaration order
const std::vector<FieldAccessor>& habit_fields();

const FieldAccessor& accessor_for(model::HabitField field);

const char* field_name(model::HabitField field);
std::optional<model::HabitField> field_from_name(std::string_view name);

} // namespace hsync::conflict
