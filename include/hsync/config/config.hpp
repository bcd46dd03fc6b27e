#pragma once

#include "hsync/conflict/field_rules.hpp"
#include "hsync/core/result.hpp"

#include <filesystem>
#include <string>

namespace hsync {

struct ConflictConfig {
    std::vector<conflict::FieldConflictRule> extensions;

    conflict::RuleTable rule_table() const { return conflict::RuleTable(extensions); }
};

struct MigrationConfig {
    std::string user_id;
    bool dry_run = false;
    bool auto_retry_after_recovery = true;
    int unusual_date_past_days = 730;
    int unusual_date_future_days = 365;
};

struct SyncConfig {
    int max_batch_retries = 5;
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Everything an orchestrator needs, passed at construction
 *
 * EXAMPLE (JSON):
 * {
 *   "conflict": { "extensions": [
 *       { "field": "reminder", "policy": "first_writer_wins", "priority": 85 } ] },
 *   "migration": { "user_id": "u1", "dry_run": true },
 *   "sync": { "max_batch_retries": 3 },
 *   "logging": { "level": "debug" }
 * }
 */
struct EngineConfig {
    ConflictConfig conflict;
    MigrationConfig migration;
    SyncConfig sync;
    LoggingConfig logging;
};

/// Missing keys keep their defaults; unknown policies and bad types are ConfigErrors
Result<EngineConfig> parse_config(const std::string& json_text);

Result<EngineConfig> load_config(const std::filesystem::path& path);

/// spdlog::set_level from logging.level
Result<void> apply_logging(const LoggingConfig& logging);

} // namespace hsync
