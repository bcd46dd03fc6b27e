#pragma once

/**
 * @file json_codec.hpp
 * @brief JSON form of legacy datasets, habit records and migration results
 *
 * Timestamps are written as unix milliseconds and read from either unix
 * milliseconds or "yyyy-MM-dd HH:mm:ss" strings. Dates are "yyyy-MM-dd".
 *
 * DATASET SHAPE:
 * {
 *   "user_id": "u1",
 *   "habits": [ { "id": "h1", "name": "Read", "goal": "5 times", ... } ],
 *   "points": { "total": 1500, "level": 2, "history": [ ... ] }
 * }
 */

#include "hsync/core/result.hpp"
#include "hsync/migration/types.hpp"
#include "hsync/model/habit_record.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace hsync::io {

struct LegacyDataset {
    std::string user_id;
    std::vector<model::HabitRecord> habits;
    migration::LegacyPointsSnapshot points;
};

nlohmann::json habit_record_to_json(const model::HabitRecord& record);
Result<model::HabitRecord> habit_record_from_json(const nlohmann::json& node);

nlohmann::json dataset_to_json(const LegacyDataset& dataset);
Result<LegacyDataset> dataset_from_json(const nlohmann::json& node);

Result<LegacyDataset> parse_dataset(const std::string& text);
Result<LegacyDataset> load_dataset(const std::filesystem::path& path);

nlohmann::json summary_to_json(const migration::MigrationSummary& summary);
nlohmann::json batch_to_json(const migration::MigrationBatch& batch);

} // namespace hsync::io
