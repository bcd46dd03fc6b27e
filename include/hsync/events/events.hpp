/**
 * @file events.hpp
 * @brief Event types emitted by the sync and migration orchestrators
 *
 * NAMING CONVENTION:
 * - Events are past-tense: SyncCompletedEvent, MigrationRolledBackEvent
 */

#pragma once

#include "hsync/conflict/resolver.hpp"
#include "hsync/core/date.hpp"
#include "hsync/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hsync::events {

// ════════════════════════════════════════════════════════
// Sync Events
// ════════════════════════════════════════════════════════

struct SyncStartedEvent {
    std::optional<Timestamp> checkpoint;   // nullopt on the first sync
    std::size_t pending_retries = 0;
};

/**
 * @brief Emitted after a sync pass fetched remote changes
 *
 * A pass with failed records still completes; those records are queued for
 * the next cycle.
 */
struct SyncCompletedEvent {
    std::size_t remote_change_count = 0;
    std::size_t local_change_count = 0;
    std::size_t conflicts_resolved = 0;
    std::size_t failed_records = 0;
    std::chrono::milliseconds duration{0};
};

/// Remote fetch failed; the checkpoint was not advanced
struct SyncFailedEvent {
    Error error;
};

struct ConflictDetectedEvent {
    std::string record_id;
    conflict::ConflictType type = conflict::ConflictType::Timestamp;
};

struct ConflictResolvedEvent {
    std::string record_id;
    std::size_t fields_resolved = 0;
    std::size_t fields_merged = 0;
};

/// A differing field had no rule and fell back to last-writer-wins
struct MissingRuleEvent {
    std::string record_id;
    std::string field_name;
};

struct RecordPersistFailedEvent {
    std::string record_id;
    Error error;
    int attempts = 1;
    bool gave_up = false;   // retry budget exhausted
};

// ════════════════════════════════════════════════════════
// Migration Events
// ════════════════════════════════════════════════════════

struct MigrationStepEvent {
    std::string user_id;
    std::string step;
    int percent_complete = 0;
};

struct MigrationFailedEvent {
    std::string user_id;
    std::string phase;   // phase in which the run failed
    Error error;
};

struct MigrationCompletedEvent {
    std::string user_id;
    bool dry_run = false;
    std::size_t habits_created = 0;
    std::size_t progress_records_created = 0;
    std::size_t transactions_created = 0;
    std::chrono::milliseconds duration{0};
};

struct MigrationRolledBackEvent {
    std::string user_id;
    std::size_t records_removed = 0;
    std::string reason;
};

} // namespace hsync::events
