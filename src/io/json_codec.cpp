#include "hsync/io/json_codec.hpp"

#include "hsync/conflict/field_registry.hpp"

#include <fstream>
#include <sstream>

namespace hsync::io {
namespace {

using nlohmann::json;

json counts_to_json(const model::DateCountMap& map) {
    json node = json::object();
    for (const auto& [key, value] : map) {
        node[key] = value;
    }
    return node;
}

Result<Timestamp> timestamp_from_json(const json& node, const char* what) {
    if (node.is_number_integer()) {
        return Ok(from_unix_millis(node.get<std::int64_t>()));
    }
    if (node.is_string()) {
        auto parsed = parse_timestamp(node.get<std::string>());
        if (parsed) {
            return Ok(*parsed);
        }
    }
    return Err<Timestamp>(ErrorCode::MalformedValue, std::string("Malformed timestamp in ") + what);
}

Result<Date> date_from_json(const json& node, const char* what) {
    if (node.is_string()) {
        auto parsed = Date::parse(node.get<std::string>());
        if (parsed) {
            return Ok(*parsed);
        }
    }
    return Err<Date>(ErrorCode::MalformedValue, std::string("Malformed date in ") + what);
}

// Keys stay as written; bad keys are the history normalizer's concern
model::DateCountMap counts_from_json(const json& node) {
    model::DateCountMap map;
    if (node.is_object()) {
        for (const auto& [key, value] : node.items()) {
            map[key] = value.get<int>();
        }
    }
    return map;
}

json streak_to_json(const model::GlobalStreak& streak) {
    return json{
        {"id", streak.id},
        {"current", streak.current_streak},
        {"longest", streak.longest_streak},
        {"total_complete_days", streak.total_complete_days},
        {"last_complete_date", streak.last_complete_date ? json(streak.last_complete_date->to_string()) : json(nullptr)},
    };
}

Result<model::HabitRecord> record_from_json(const json& node) {
    if (!node.is_object()) {
        return Err<model::HabitRecord>(ErrorCode::MalformedValue, "Habit record must be an object");
    }
    model::HabitRecord record;
    record.id = node.value("id", std::string());
    record.name = node.value("name", std::string());
    record.description = node.value("description", std::string());
    record.icon = node.value("icon", std::string());
    record.color = node.value("color", std::string());
    record.schedule = node.value("schedule", std::string());
    record.goal = node.value("goal", std::string());
    record.reminder = node.value("reminder", std::string());
    record.baseline = node.value("baseline", 0);
    record.target = node.value("target", 0);
    record.is_deleted = node.value("isDeleted", false);

    const auto type_text = node.value("habitType", std::string("formation"));
    auto type = model::HabitTypeUtils::from_string(type_text);
    if (!type) {
        return Err<model::HabitRecord>(ErrorCode::MalformedValue,
                                       "Unknown habitType '" + type_text + "' for habit " + record.id);
    }
    record.habit_type = *type;

    if (node.contains("createdAt")) {
        auto created = timestamp_from_json(node.at("createdAt"), "createdAt");
        if (created.is_error()) {
            return Err<model::HabitRecord>(created.error());
        }
        record.created_at = created.value();
    }
    if (node.contains("lastModified")) {
        auto modified = timestamp_from_json(node.at("lastModified"), "lastModified");
        if (modified.is_error()) {
            return Err<model::HabitRecord>(modified.error());
        }
        record.last_modified = modified.value();
    }

    if (node.contains("startDate")) {
        auto start = date_from_json(node.at("startDate"), "startDate");
        if (start.is_error()) {
            return Err<model::HabitRecord>(start.error());
        }
        record.start_date = start.value();
    } else {
        record.start_date = Date::from_timestamp_utc(record.created_at);
    }
    if (node.contains("endDate") && !node.at("endDate").is_null()) {
        auto end = date_from_json(node.at("endDate"), "endDate");
        if (end.is_error()) {
            return Err<model::HabitRecord>(end.error());
        }
        record.end_date = end.value();
    }

    if (node.contains("completionHistory")) record.completion_history = counts_from_json(node.at("completionHistory"));
    if (node.contains("difficultyHistory")) record.difficulty_history = counts_from_json(node.at("difficultyHistory"));
    if (node.contains("actualUsage")) record.actual_usage = counts_from_json(node.at("actualUsage"));

    if (node.contains("fieldModified")) {
        for (const auto& [name, value] : node.at("fieldModified").items()) {
            auto field = conflict::field_from_name(name);
            if (!field) {
                return Err<model::HabitRecord>(ErrorCode::MalformedValue, "Unknown field in fieldModified: " + name);
            }
            auto stamp = timestamp_from_json(value, "fieldModified");
            if (stamp.is_error()) {
                return Err<model::HabitRecord>(stamp.error());
            }
            record.field_modified[*field] = stamp.value();
        }
    }
    return Ok(std::move(record));
}

} // namespace

json habit_record_to_json(const model::HabitRecord& record) {
    json node{
        {"id", record.id},
        {"name", record.name},
        {"description", record.description},
        {"icon", record.icon},
        {"color", record.color},
        {"habitType", model::HabitTypeUtils::to_string(record.habit_type)},
        {"schedule", record.schedule},
        {"goal", record.goal},
        {"reminder", record.reminder},
        {"startDate", record.start_date.to_string()},
        {"endDate", record.end_date ? json(record.end_date->to_string()) : json(nullptr)},
        {"createdAt", to_unix_millis(record.created_at)},
        {"baseline", record.baseline},
        {"target", record.target},
        {"completionHistory", counts_to_json(record.completion_history)},
        {"difficultyHistory", counts_to_json(record.difficulty_history)},
        {"actualUsage", counts_to_json(record.actual_usage)},
        {"lastModified", to_unix_millis(record.last_modified)},
        {"isDeleted", record.is_deleted},
    };
    if (!record.field_modified.empty()) {
        json stamps = json::object();
        for (const auto& [field, stamp] : record.field_modified) {
            stamps[conflict::field_name(field)] = to_unix_millis(stamp);
        }
        node["fieldModified"] = std::move(stamps);
    }
    return node;
}

Result<model::HabitRecord> habit_record_from_json(const json& node) {
    try {
        return record_from_json(node);
    } catch (const json::exception& e) {
        return Err<model::HabitRecord>(ErrorCode::MalformedValue, std::string("Malformed habit record: ") + e.what());
    }
}

json dataset_to_json(const LegacyDataset& dataset) {
    json habits = json::array();
    for (const auto& record : dataset.habits) {
        habits.push_back(habit_record_to_json(record));
    }
    json history = json::array();
    for (const auto& entry : dataset.points.history) {
        history.push_back(json{{"timestamp", entry.timestamp}, {"amount", entry.amount}, {"reason", entry.reason}});
    }
    json points{{"total", dataset.points.total_points}, {"history", std::move(history)}};
    if (dataset.points.stored_level) {
        points["level"] = *dataset.points.stored_level;
    }
    return json{{"user_id", dataset.user_id}, {"habits", std::move(habits)}, {"points", std::move(points)}};
}

Result<LegacyDataset> dataset_from_json(const json& node) {
    try {
        if (!node.is_object()) {
            return Err<LegacyDataset>(ErrorCode::MalformedValue, "Dataset must be an object");
        }
        LegacyDataset dataset;
        dataset.user_id = node.value("user_id", std::string());

        if (node.contains("habits")) {
            for (const auto& item : node.at("habits")) {
                auto record = record_from_json(item);
                if (record.is_error()) {
                    return Err<LegacyDataset>(record.error());
                }
                dataset.habits.push_back(std::move(record.value()));
            }
        }

        if (node.contains("points")) {
            const auto& points = node.at("points");
            dataset.points.total_points = points.value("total", std::int64_t{0});
            if (points.contains("level") && !points.at("level").is_null()) {
                dataset.points.stored_level = points.at("level").get<int>();
            }
            if (points.contains("history")) {
                for (const auto& item : points.at("history")) {
                    migration::LegacyPointEntry entry;
                    entry.timestamp = item.value("timestamp", std::string());
                    entry.amount = item.value("amount", std::int64_t{0});
                    entry.reason = item.value("reason", std::string());
                    dataset.points.history.push_back(std::move(entry));
                }
            }
        }
        return Ok(std::move(dataset));
    } catch (const json::exception& e) {
        return Err<LegacyDataset>(ErrorCode::MalformedValue, std::string("Malformed dataset: ") + e.what());
    }
}

Result<LegacyDataset> parse_dataset(const std::string& text) {
    try {
        return dataset_from_json(json::parse(text));
    } catch (const json::exception& e) {
        return Err<LegacyDataset>(ErrorCode::MalformedValue, std::string("Dataset is not valid JSON: ") + e.what());
    }
}

Result<LegacyDataset> load_dataset(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<LegacyDataset>(ErrorCode::NotFound, "Cannot open dataset: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_dataset(buffer.str());
}

json summary_to_json(const migration::MigrationSummary& summary) {
    json checks = json::array();
    for (const auto& check : summary.validation.checks) {
        checks.push_back(json{{"name", check.name}, {"passed", check.passed}, {"detail", check.detail}});
    }

    json node{
        {"user_id", summary.user_id},
        {"phase", migration::to_string(summary.phase)},
        {"dry_run", summary.dry_run},
        {"duration_ms", summary.duration.count()},
        {"habits_created", summary.habits_created},
        {"habits_rejected", summary.habits_rejected},
        {"progress_records_created", summary.progress_records_created},
        {"transactions_created", summary.transactions_created},
        {"schedule_kinds", summary.schedule_kinds},
        {"decoder_warnings", summary.decoder_warnings},
        {"skipped_date_keys", summary.skipped_date_keys},
        {"skipped_point_entries", summary.skipped_point_entries},
        {"total_points", summary.total_points},
        {"level", summary.level},
        {"recovered_interrupted_run", summary.recovered_interrupted_run},
        {"validation", json{{"passed", summary.validation.passed()},
                            {"checks", std::move(checks)},
                            {"warnings", summary.validation.warnings}}},
    };
    node["streak"] = summary.streak ? streak_to_json(*summary.streak) : json(nullptr);
    if (summary.error) {
        node["error"] = json{{"code", to_string(summary.error->code)},
                             {"severity", to_string(summary.error->severity())},
                             {"message", summary.error->message}};
    } else {
        node["error"] = nullptr;
    }
    return node;
}

json batch_to_json(const migration::MigrationBatch& batch) {
    json habits = json::array();
    for (const auto& habit : batch.habits) {
        habits.push_back(json{
            {"id", habit.id},
            {"name", habit.name},
            {"habit_type", model::HabitTypeUtils::to_string(habit.habit_type)},
            {"goal", json{{"count", habit.goal.count}, {"unit", habit.goal.unit}}},
            {"schedule", model::describe(habit.schedule)},
            {"schedule_kind", model::schedule_kind(habit.schedule)},
            {"start_date", habit.start_date.to_string()},
            {"end_date", habit.end_date ? json(habit.end_date->to_string()) : json(nullptr)},
            {"is_deleted", habit.is_deleted},
        });
    }
    json progress = json::array();
    for (const auto& record : batch.progress) {
        progress.push_back(json{
            {"id", record.id},
            {"habit_id", record.habit_id},
            {"date", record.date.to_string()},
            {"progress", record.progress_count},
            {"goal", record.goal_count},
            {"complete", record.is_complete()},
            {"difficulty", record.difficulty ? json(*record.difficulty) : json(nullptr)},
        });
    }
    json node{{"user_id", batch.user_id}, {"habits", std::move(habits)}, {"progress", std::move(progress)}};
    node["streak"] = batch.streak ? streak_to_json(*batch.streak) : json(nullptr);
    if (batch.user_progress) {
        json ledger = json::array();
        for (const auto& t : batch.user_progress->transactions) {
            ledger.push_back(json{{"id", t.id}, {"amount", t.amount}, {"reason", t.reason},
                                  {"timestamp", format_timestamp(t.timestamp)}});
        }
        node["user_progress"] = json{{"total_points", batch.user_progress->total_points},
                                     {"level", batch.user_progress->level},
                                     {"transactions", std::move(ledger)}};
    } else {
        node["user_progress"] = nullptr;
    }
    return node;
}

} // namespace hsync::io
