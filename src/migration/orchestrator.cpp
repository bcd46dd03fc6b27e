#include "hsync/migration/orchestrator.hpp"

#include "hsync/events/events.hpp"
#include "hsync/legacy/decoder.hpp"
#include "hsync/legacy/history_normalizer.hpp"
#include "hsync/migration/points.hpp"
#include "hsync/migration/validator.hpp"
#include "hsync/streak/recompute.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace hsync::migration {
namespace {

const char* step_name(MigrationPhase phase) {
    switch (phase) {
        case MigrationPhase::ValidatingSource: return "Validating source";
        case MigrationPhase::MigratingHabits: return "Migrating habits";
        case MigrationPhase::MigratingStreak: return "Recomputing streak";
        case MigrationPhase::MigratingPoints: return "Migrating points";
        case MigrationPhase::Validating: return "Validating";
        case MigrationPhase::Committed: return "Committed";
        default: return to_string(phase);
    }
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) {
            out += "; ";
        }
        out += part;
    }
    return out;
}

} // namespace

MigrationOrchestrator::MigrationOrchestrator(const LegacySource& legacy,
                                             NormalizedStore& store,
                                             MigrationFlagStore& flags,
                                             const streak::ExceptionCalendar& calendar,
                                             EngineConfig config,
                                             const Clock& clock,
                                             events::EventBus* bus,
                                             MigrationObserver* observer)
    : legacy_(legacy),
      store_(store),
      flags_(flags),
      calendar_(calendar),
      config_(std::move(config)),
      clock_(clock),
      bus_(bus),
      observer_(observer) {}

Result<MigrationSummary> MigrationOrchestrator::migrate() {
    return migrate(config_.migration.user_id);
}

Result<MigrationSummary> MigrationOrchestrator::migrate(const std::string& user_id) {
    MigrationLatch latch(flags_, user_id);
    if (!latch.acquired()) {
        const auto started = std::chrono::steady_clock::now();
        MigrationSession session(user_id);
        MigrationSummary summary;
        summary.user_id = user_id;
        summary.dry_run = config_.migration.dry_run;
        step(session, MigrationPhase::ValidatingSource, 0);
        return fail(session, summary,
                    Error{ErrorCode::MigrationInProgress, "Another migration is running for user " + user_id},
                    false, started);
    }
    return run(user_id, config_.migration.auto_retry_after_recovery);
}

Result<std::size_t> MigrationOrchestrator::rollback(const std::string& user_id) {
    MigrationLatch latch(flags_, user_id);
    if (!latch.acquired()) {
        return Err<std::size_t>(ErrorCode::MigrationInProgress,
                                "Cannot roll back while a migration is running for user " + user_id);
    }
    return rollback_locked(user_id, "requested");
}

std::optional<MigrationSummary> MigrationOrchestrator::last_summary() const {
    std::lock_guard lock(summary_mutex_);
    return last_summary_;
}

Result<MigrationSummary> MigrationOrchestrator::run(const std::string& user_id, bool allow_recovery_retry) {
    const auto started = std::chrono::steady_clock::now();
    MigrationSession session(user_id);
    MigrationSummary summary;
    summary.user_id = user_id;
    summary.dry_run = config_.migration.dry_run;

    spdlog::info("[Migration] user={} dry_run={} starting", user_id, summary.dry_run);

    // ── ValidatingSource ────────────────────────────────
    step(session, MigrationPhase::ValidatingSource, 0);

    auto flag = flags_.state(user_id);
    if (flag.is_error()) {
        return fail(session, summary, Error{ErrorCode::StoreFailure, flag.error().message}, false, started);
    }
    if (flag.value().completed) {
        return fail(session, summary,
                    Error{ErrorCode::AlreadyMigrated,
                          "User " + user_id + " is already migrated; roll back before migrating again"},
                    false, started);
    }

    auto existing = store_.count_records(user_id);
    if (existing.is_error()) {
        return fail(session, summary, Error{ErrorCode::StoreFailure, existing.error().message}, false, started);
    }
    if (existing.value() > 0) {
        spdlog::warn("[Migration] user={} found {} records from an interrupted run", user_id, existing.value());
        // Recovery deletes records, which a dry run must not do
        auto failed = fail(session, summary,
                           Error{ErrorCode::InterruptedMigration,
                                 std::to_string(existing.value()) + " records left by an interrupted migration"},
                           !summary.dry_run, started);
        if (!allow_recovery_retry || session.phase() != MigrationPhase::RolledBack) {
            return failed;
        }

        spdlog::info("[Migration] user={} retrying after recovery", user_id);
        auto retried = run(user_id, false);
        {
            std::lock_guard lock(summary_mutex_);
            if (last_summary_) {
                last_summary_->recovered_interrupted_run = true;
            }
        }
        if (retried.is_ok()) {
            retried.value().recovered_interrupted_run = true;
        }
        return retried;
    }

    auto legacy_habits = legacy_.load_habits(user_id);
    if (legacy_habits.is_error()) {
        return fail(session, summary, Error{ErrorCode::StoreFailure, legacy_habits.error().message}, true, started);
    }
    auto legacy_points = legacy_.load_points(user_id);
    if (legacy_points.is_error()) {
        return fail(session, summary, Error{ErrorCode::StoreFailure, legacy_points.error().message}, true, started);
    }

    // ── MigratingHabits ─────────────────────────────────
    step(session, MigrationPhase::MigratingHabits, 10);

    MigrationBatch batch;
    batch.user_id = user_id;
    std::set<std::string> seen_ids;
    std::size_t legacy_entries = 0;
    std::size_t rejected_entries = 0;

    const auto& habits = legacy_habits.value();
    for (std::size_t i = 0; i < habits.size(); ++i) {
        const auto& record = habits[i];
        legacy_entries += record.progress_history().size();

        if (record.id.empty() || !seen_ids.insert(record.id).second) {
            const std::string warning = "habit '" + record.name + "' rejected: " +
                                        (record.id.empty() ? "empty id" : "duplicate id " + record.id);
            spdlog::warn("[Migration] user={} {}", user_id, warning);
            summary.decoder_warnings.push_back(warning);
            ++summary.habits_rejected;
            rejected_entries += record.progress_history().size();
            continue;
        }

        auto decoded = legacy::decode_habit(record, user_id);
        auto history = legacy::normalize_history(record, decoded.habit);

        for (auto& warning : decoded.warnings) {
            spdlog::warn("[Migration] user={} {}", user_id, warning);
            summary.decoder_warnings.push_back(std::move(warning));
        }
        for (const auto& key : history.skipped_keys) {
            summary.skipped_date_keys.push_back(record.id + ":" + key);
        }
        ++summary.schedule_kinds[model::schedule_kind(decoded.habit.schedule)];

        batch.habits.push_back(std::move(decoded.habit));
        for (auto& progress : history.progress) {
            batch.progress.push_back(std::move(progress));
        }

        if (observer_ != nullptr) {
            observer_->on_progress(step_name(MigrationPhase::MigratingHabits),
                                   10 + static_cast<int>(40 * (i + 1) / habits.size()));
        }
    }

    // ── MigratingStreak ─────────────────────────────────
    step(session, MigrationPhase::MigratingStreak, 55);
    batch.streak = streak::recompute(batch.habits, batch.progress, calendar_, user_id, clock_.today());

    // ── MigratingPoints ─────────────────────────────────
    step(session, MigrationPhase::MigratingPoints, 70);
    auto points = migrate_points(legacy_points.value(), user_id, clock_.now());
    summary.skipped_point_entries = points.skipped_entries;
    batch.user_progress = std::move(points.progress);

    summary.habits_created = batch.habits.size();
    summary.progress_records_created = batch.progress.size();
    summary.transactions_created = batch.user_progress->transactions.size();
    summary.streak = batch.streak;
    summary.total_points = batch.user_progress->total_points;
    summary.level = batch.user_progress->level;

    // ── Validating ──────────────────────────────────────
    step(session, MigrationPhase::Validating, 85);

    ValidationInputs inputs;
    inputs.legacy_habit_count = habits.size();
    inputs.rejected_habit_count = summary.habits_rejected;
    inputs.legacy_progress_entries = legacy_entries - rejected_entries;
    inputs.skipped_date_keys = summary.skipped_date_keys.size();
    inputs.legacy_total_points = legacy_points.value().total_points;
    inputs.decoder_warnings = summary.decoder_warnings;
    inputs.today = clock_.today();
    inputs.unusual_date_past_days = config_.migration.unusual_date_past_days;
    inputs.unusual_date_future_days = config_.migration.unusual_date_future_days;

    summary.validation = validate_batch(batch, inputs);
    if (!summary.validation.passed()) {
        return fail(session, summary,
                    Error{ErrorCode::ValidationFailed, join(summary.validation.hard_errors())},
                    true, started);
    }

    // ── Committed ───────────────────────────────────────
    if (!config_.migration.dry_run) {
        auto recorded = flags_.record_manifest(user_id, batch.manifest());
        if (recorded.is_error()) {
            return fail(session, summary, Error{ErrorCode::CommitFailed, recorded.error().message}, true, started);
        }
        auto committed = store_.commit(batch);
        if (committed.is_error()) {
            return fail(session, summary, Error{ErrorCode::CommitFailed, committed.error().message}, true, started);
        }
        auto flagged = flags_.mark_completed(user_id, clock_.now());
        if (flagged.is_error()) {
            return fail(session, summary, Error{ErrorCode::CommitFailed, flagged.error().message}, true, started);
        }
    }
    step(session, MigrationPhase::Committed, 100);
    summary.phase = session.phase();

    finish(summary, started);
    emit(events::MigrationCompletedEvent{user_id, summary.dry_run, summary.habits_created,
                                         summary.progress_records_created, summary.transactions_created,
                                         summary.duration});
    spdlog::info("[Migration] user={} committed dry_run={} habits={} progress={} points={} level={}",
                 user_id, summary.dry_run, summary.habits_created, summary.progress_records_created,
                 summary.total_points, summary.level);
    return Ok(std::move(summary));
}

Result<std::size_t> MigrationOrchestrator::rollback_locked(const std::string& user_id, const std::string& reason) {
    auto state = flags_.state(user_id);
    if (state.is_error()) {
        return Err<std::size_t>(state.error());
    }

    auto removed = state.value().manifest ? store_.remove(*state.value().manifest)
                                          : store_.remove_all_for_user(user_id);
    if (removed.is_error()) {
        spdlog::error("[Migration] user={} rollback failed: {}", user_id, removed.error().message);
        return removed;
    }

    auto cleared = flags_.clear(user_id);
    if (cleared.is_error()) {
        return Err<std::size_t>(cleared.error());
    }

    spdlog::warn("[Migration] user={} rolled back, removed={} reason={}", user_id, removed.value(), reason);
    emit(events::MigrationRolledBackEvent{user_id, removed.value(), reason});
    return removed;
}

Result<MigrationSummary> MigrationOrchestrator::fail(MigrationSession& session,
                                                     MigrationSummary& summary,
                                                     const Error& error,
                                                     bool roll_back,
                                                     std::chrono::steady_clock::time_point started) {
    const std::string failed_phase = to_string(session.phase());
    auto marked = session.mark_failed(error.message);
    if (marked.is_error()) {
        spdlog::error("[Migration] user={} {}", session.user_id(), marked.error().message);
    }
    summary.error = error;

    spdlog::error("[Migration] user={} failed in {}: {}", session.user_id(), failed_phase, error.describe());
    emit(events::MigrationFailedEvent{session.user_id(), failed_phase, error});
    if (observer_ != nullptr) {
        observer_->on_error(error);
    }

    if (roll_back) {
        // A dry run has written nothing, so there is nothing to undo
        auto rolled = summary.dry_run ? Result<std::size_t>(OkValue<std::size_t>(0))
                                      : rollback_locked(session.user_id(), error.message);
        if (rolled.is_ok()) {
            auto moved = session.transition_to(MigrationPhase::RolledBack);
            if (moved.is_error()) {
                spdlog::error("[Migration] user={} {}", session.user_id(), moved.error().message);
            }
        }
    }

    summary.phase = session.phase();
    finish(summary, started);
    return Err<MigrationSummary>(error);
}

void MigrationOrchestrator::step(MigrationSession& session, MigrationPhase phase, int percent) {
    auto moved = session.transition_to(phase);
    if (moved.is_error()) {
        spdlog::error("[Migration] user={} {}", session.user_id(), moved.error().message);
        return;
    }
    emit(events::MigrationStepEvent{session.user_id(), step_name(phase), percent});
    if (observer_ != nullptr) {
        observer_->on_progress(step_name(phase), percent);
    }
}

void MigrationOrchestrator::finish(MigrationSummary& summary, std::chrono::steady_clock::time_point started) {
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    {
        std::lock_guard lock(summary_mutex_);
        last_summary_ = summary;
    }
    if (observer_ != nullptr) {
        observer_->on_complete(summary);
    }
}

} // namespace hsync::migration
