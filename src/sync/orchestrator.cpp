#include "hsync/sync/orchestrator.hpp"

#include "hsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <set>

namespace hsync::sync {

SyncOrchestrator::SyncOrchestrator(LocalHabitStore& local,
                                   RemoteHabitStore& remote,
                                   const EngineConfig& config,
                                   const Clock& clock,
                                   events::EventBus* bus)
    : local_(local),
      remote_(remote),
      resolver_(config.conflict.rule_table()),
      clock_(clock),
      bus_(bus),
      max_batch_retries_(config.sync.max_batch_retries) {}

std::size_t SyncOrchestrator::pending_retry_count() const {
    std::lock_guard lock(mutex_);
    return retries_.size();
}

Result<SyncResult> SyncOrchestrator::sync() {
    std::vector<std::function<void()>> deliveries;
    auto outcome = [&]() {
        std::lock_guard lock(mutex_);
        auto pass = run_pass();
        deliveries.swap(deferred_events_);
        return pass;
    }();
    // Handlers run unlocked so they may call back into the orchestrator
    for (auto& deliver : deliveries) {
        deliver();
    }
    return outcome;
}

Result<SyncResult> SyncOrchestrator::run_pass() {
    const auto started = std::chrono::steady_clock::now();
    const auto checkpoint = local_.checkpoint();

    emit(events::SyncStartedEvent{checkpoint, retries_.size()});

    auto fetched = remote_.fetch_changes_since(checkpoint);
    if (fetched.is_error()) {
        Error error{ErrorCode::RemoteFetchFailed, fetched.error().message};
        spdlog::error("[SyncOrchestrator] remote fetch failed, checkpoint kept: {}", error.message);
        emit(events::SyncFailedEvent{error});
        return Err<SyncResult>(error);
    }

    auto pending = local_.pending_changes();
    if (pending.is_error()) {
        spdlog::error("[SyncOrchestrator] reading local changes failed: {}", pending.error().message);
        emit(events::SyncFailedEvent{pending.error()});
        return Err<SyncResult>(pending.error());
    }

    SyncResult result;
    result.remote_change_count = fetched.value().size();
    result.local_change_count = pending.value().size();

    // Local side of this pass: pending edits, plus writes that failed last time
    std::map<std::string, model::HabitRecord> local_changes;
    for (auto& record : pending.value()) {
        local_changes.emplace(record.id, std::move(record));
    }
    auto retries = std::move(retries_);
    retries_.clear();
    for (const auto& [id, write] : retries) {
        if (write.from_remote) {
            // Refetched: the checkpoint was held before it
            continue;
        }
        auto it = local_changes.find(id);
        if (it == local_changes.end()) {
            local_changes.emplace(id, write.record);
            continue;
        }
        auto combined = resolver_.resolve(write.record, it->second, clock_.now());
        if (combined.is_error()) {
            spdlog::warn("[SyncOrchestrator] id={} dropping stale retry: {}", id, combined.error().message);
            continue;
        }
        it->second = combined.value().resolved;
    }

    auto attempts_for = [&retries](const std::string& id) {
        auto it = retries.find(id);
        return it == retries.end() ? 0 : it->second.attempts;
    };

    auto fail = [&](const model::HabitRecord& record, const Error& error, bool from_remote) {
        retries_[record.id] = PendingWrite{record, attempts_for(record.id), from_remote};
        queue_retry(record, error, result);
    };

    std::optional<Timestamp> newest_seen;
    std::optional<Timestamp> oldest_failed;
    std::set<std::string> paired;

    auto hold_checkpoint = [&oldest_failed](Timestamp server_modified) {
        oldest_failed = oldest_failed ? std::min(*oldest_failed, server_modified) : server_modified;
    };

    for (const auto& change : fetched.value()) {
        newest_seen = newest_seen ? std::max(*newest_seen, change.server_modified) : change.server_modified;

        model::HabitRecord theirs = change.record;
        theirs.last_modified = change.server_modified;

        auto mine_it = local_changes.find(theirs.id);
        if (mine_it == local_changes.end()) {
            auto saved = local_.save(theirs);
            if (saved.is_error()) {
                fail(theirs, saved.error(), true);
                hold_checkpoint(change.server_modified);
            }
            continue;
        }

        paired.insert(theirs.id);
        const model::HabitRecord& mine = mine_it->second;
        if (mine.last_modified != theirs.last_modified || !mine.content_equals(theirs)) {
            emit(events::ConflictDetectedEvent{theirs.id, conflict::classify(mine, theirs)});
        }

        auto resolution = resolver_.resolve(mine, theirs, clock_.now());
        if (resolution.is_error()) {
            spdlog::error("[SyncOrchestrator] id={} resolve failed: {}", theirs.id, resolution.error().message);
            fail(mine, resolution.error(), false);
            hold_checkpoint(change.server_modified);
            continue;
        }
        report_resolution(theirs.id, resolution.value());
        ++result.conflicts_resolved;

        auto persisted = persist_both(resolution.value().resolved);
        if (persisted.is_error()) {
            fail(resolution.value().resolved, persisted.error(), false);
            hold_checkpoint(change.server_modified);
        }
    }

    for (const auto& [id, record] : local_changes) {
        if (paired.count(id) > 0) {
            continue;
        }
        auto persisted = persist_both(record);
        if (persisted.is_error()) {
            fail(record, persisted.error(), false);
        }
    }

    // A remote change that was not incorporated keeps the checkpoint just
    // before it, so the change is refetched by this or any later orchestrator.
    std::optional<Timestamp> next_checkpoint = newest_seen;
    if (oldest_failed) {
        next_checkpoint = *oldest_failed - std::chrono::milliseconds{1};
        if (checkpoint && *next_checkpoint < *checkpoint) {
            next_checkpoint = checkpoint;
        }
        spdlog::info("[SyncOrchestrator] checkpoint held at {} for failed remote changes",
                     format_timestamp(*next_checkpoint));
    }

    if (next_checkpoint && next_checkpoint != checkpoint) {
        auto saved = local_.save_checkpoint(*next_checkpoint);
        if (saved.is_error()) {
            // Next pass refetches the same window; adoption is idempotent
            spdlog::warn("[SyncOrchestrator] checkpoint not saved: {}", saved.error().message);
        }
    }

    result.success = result.failed_records.empty() && result.stuck_records.empty();

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    emit(events::SyncCompletedEvent{result.remote_change_count, result.local_change_count,
                                    result.conflicts_resolved,
                                    result.failed_records.size() + result.stuck_records.size(),
                                    duration});
    spdlog::debug("[SyncOrchestrator] remote={} local={} conflicts={} failed={} stuck={}",
                  result.remote_change_count, result.local_change_count, result.conflicts_resolved,
                  result.failed_records.size(), result.stuck_records.size());
    return Ok(std::move(result));
}

Result<void> SyncOrchestrator::persist_both(const model::HabitRecord& record) {
    auto upserted = remote_.upsert(record);
    if (upserted.is_error()) {
        return upserted;
    }
    auto saved = local_.save(record);
    if (saved.is_error()) {
        return saved;
    }
    return local_.mark_synced(record.id);
}

void SyncOrchestrator::queue_retry(const model::HabitRecord& record, const Error& error, SyncResult& result) {
    auto& write = retries_[record.id];
    write.record = record;
    ++write.attempts;

    const bool gave_up = write.attempts > max_batch_retries_;
    spdlog::warn("[SyncOrchestrator] id={} persist failed (attempt {}): {}",
                 record.id, write.attempts, error.message);
    emit(events::RecordPersistFailedEvent{record.id, error, write.attempts, gave_up});

    if (gave_up) {
        result.stuck_records.push_back(record.id);
        if (write.from_remote) {
            // Still refetched every pass; keep counting so it stays reported
            spdlog::error("[SyncOrchestrator] id={} remote change not adopted after {} attempts",
                          record.id, write.attempts);
        } else {
            spdlog::error("[SyncOrchestrator] id={} dropped after {} attempts", record.id, write.attempts);
            retries_.erase(record.id);
        }
    } else {
        result.failed_records.push_back(record.id);
    }
}

void SyncOrchestrator::report_resolution(const std::string& id,
                                         const conflict::ConflictResolutionResult& resolution) {
    std::size_t merged = 0;
    for (const auto& decision : resolution.decisions) {
        if (decision.winner == conflict::Winner::Merged) {
            ++merged;
        }
    }
    for (const auto& field : resolution.missing_rules) {
        emit(events::MissingRuleEvent{id, field});
    }
    for (const auto& diagnostic : resolution.diagnostics) {
        spdlog::warn("[ConflictResolver] id={} {}", id, diagnostic);
    }
    emit(events::ConflictResolvedEvent{id, resolution.decisions.size(), merged});
}

} // namespace hsync::sync
