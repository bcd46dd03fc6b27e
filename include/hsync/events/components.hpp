/**
 * @file components.hpp
 * @brief Ready-made subscribers for engine events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * SyncOrchestrator sync(local, remote, config, clock, &bus);
 */

#pragma once

#include "hsync/events/event_bus.hpp"
#include "hsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <optional>

namespace hsync::events {

/**
 * @brief Logs every engine event through spdlog
 *
 * Conflicts, missing rules and persist failures log as warnings; fatal sync
 * and migration failures as errors.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SyncStartedEvent>([this](const SyncStartedEvent& e) { on_sync_started(e); });
        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) { on_sync_completed(e); });
        bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent& e) { on_sync_failed(e); });
        bus_.subscribe<ConflictDetectedEvent>([this](const ConflictDetectedEvent& e) { on_conflict_detected(e); });
        bus_.subscribe<ConflictResolvedEvent>([this](const ConflictResolvedEvent& e) { on_conflict_resolved(e); });
        bus_.subscribe<MissingRuleEvent>([this](const MissingRuleEvent& e) { on_missing_rule(e); });
        bus_.subscribe<RecordPersistFailedEvent>([this](const RecordPersistFailedEvent& e) { on_persist_failed(e); });
        bus_.subscribe<MigrationStepEvent>([this](const MigrationStepEvent& e) { on_migration_step(e); });
        bus_.subscribe<MigrationFailedEvent>([this](const MigrationFailedEvent& e) { on_migration_failed(e); });
        bus_.subscribe<MigrationCompletedEvent>([this](const MigrationCompletedEvent& e) { on_migration_completed(e); });
        bus_.subscribe<MigrationRolledBackEvent>([this](const MigrationRolledBackEvent& e) { on_rolled_back(e); });
    }

private:
    void on_sync_started(const SyncStartedEvent& e) {
        spdlog::info("[SyncStarted] checkpoint={} retries={}",
                     e.checkpoint ? format_timestamp(*e.checkpoint) : std::string("none"),
                     e.pending_retries);
    }

    void on_sync_completed(const SyncCompletedEvent& e) {
        spdlog::info("[SyncCompleted] remote={} local={} conflicts={} failed={} duration={}ms",
                     e.remote_change_count, e.local_change_count, e.conflicts_resolved,
                     e.failed_records, e.duration.count());
    }

    void on_sync_failed(const SyncFailedEvent& e) {
        spdlog::error("[SyncFailed] {}", e.error.describe());
    }

    void on_conflict_detected(const ConflictDetectedEvent& e) {
        spdlog::warn("[ConflictDetected] id={} type={}", e.record_id, conflict::to_string(e.type));
    }

    void on_conflict_resolved(const ConflictResolvedEvent& e) {
        spdlog::info("[ConflictResolved] id={} fields={} merged={}",
                     e.record_id, e.fields_resolved, e.fields_merged);
    }

    void on_missing_rule(const MissingRuleEvent& e) {
        spdlog::warn("[MissingRule] id={} field={} fallback=last_writer_wins", e.record_id, e.field_name);
    }

    void on_persist_failed(const RecordPersistFailedEvent& e) {
        spdlog::warn("[PersistFailed] id={} attempts={} gave_up={} error={}",
                     e.record_id, e.attempts, e.gave_up, e.error.describe());
    }

    void on_migration_step(const MigrationStepEvent& e) {
        spdlog::info("[Migration] user={} step={} progress={}%", e.user_id, e.step, e.percent_complete);
    }

    void on_migration_failed(const MigrationFailedEvent& e) {
        spdlog::error("[MigrationFailed] user={} phase={} error={}", e.user_id, e.phase, e.error.describe());
    }

    void on_migration_completed(const MigrationCompletedEvent& e) {
        spdlog::info("[MigrationCompleted] user={} dry_run={} habits={} progress={} transactions={} duration={}ms",
                     e.user_id, e.dry_run, e.habits_created, e.progress_records_created,
                     e.transactions_created, e.duration.count());
    }

    void on_rolled_back(const MigrationRolledBackEvent& e) {
        spdlog::warn("[MigrationRolledBack] user={} removed={} reason={}", e.user_id, e.records_removed, e.reason);
    }

    EventBus& bus_;
};

/**
 * @brief Counts engine outcomes for monitoring
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * stats.conflicts_resolved.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> syncs_completed{0};
        std::atomic<uint64_t> syncs_failed{0};
        std::atomic<uint64_t> conflicts_detected{0};
        std::atomic<uint64_t> conflicts_resolved{0};
        std::atomic<uint64_t> persist_failures{0};
        std::atomic<uint64_t> missing_rule_hits{0};
        std::atomic<uint64_t> migrations_committed{0};
        std::atomic<uint64_t> migrations_failed{0};
        std::atomic<uint64_t> migrations_rolled_back{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent&) { stats_.syncs_completed++; });
        bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent&) { stats_.syncs_failed++; });
        bus_.subscribe<ConflictDetectedEvent>([this](const ConflictDetectedEvent&) { stats_.conflicts_detected++; });
        bus_.subscribe<ConflictResolvedEvent>([this](const ConflictResolvedEvent&) { stats_.conflicts_resolved++; });
        bus_.subscribe<RecordPersistFailedEvent>([this](const RecordPersistFailedEvent&) { stats_.persist_failures++; });
        bus_.subscribe<MissingRuleEvent>([this](const MissingRuleEvent&) { stats_.missing_rule_hits++; });
        bus_.subscribe<MigrationCompletedEvent>([this](const MigrationCompletedEvent& e) {
            if (!e.dry_run) {
                stats_.migrations_committed++;
            }
        });
        bus_.subscribe<MigrationFailedEvent>([this](const MigrationFailedEvent&) { stats_.migrations_failed++; });
        bus_.subscribe<MigrationRolledBackEvent>([this](const MigrationRolledBackEvent&) {
            stats_.migrations_rolled_back++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Engine Statistics:");
        spdlog::info("  Syncs completed:   {}", stats_.syncs_completed.load());
        spdlog::info("  Syncs failed:      {}", stats_.syncs_failed.load());
        spdlog::info("  Conflicts det.:    {}", stats_.conflicts_detected.load());
        spdlog::info("  Conflicts res.:    {}", stats_.conflicts_resolved.load());
        spdlog::info("  Persist failures:  {}", stats_.persist_failures.load());
        spdlog::info("  Missing rules:     {}", stats_.missing_rule_hits.load());
        spdlog::info("  Migrations:        {} committed, {} failed, {} rolled back",
                     stats_.migrations_committed.load(), stats_.migrations_failed.load(),
                     stats_.migrations_rolled_back.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace hsync::events
