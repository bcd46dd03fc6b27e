#pragma once

/**
 * @file orchestrator.hpp
 * @brief One-time, per-user move from the legacy schema to the normalized one
 *
 * WHY THIS FILE EXISTS:
 * The legacy layer stores habits as flat records with free-text goals and
 * schedules, and keeps streak and points totals that may have drifted from
 * the raw history. The migration decodes every habit, rebuilds the streak
 * and the points ledger from first principles, validates the result, and
 * commits it in one transaction.
 *
 * HOW IT FAILS:
 * - Already migrated, or another run holds the latch: refused at
 *   ValidatingSource, nothing written
 * - Any later failure: Failed -> RolledBack, every record of the run is
 *   deleted through the manifest and the flag is cleared
 * - Records left by an interrupted run: treated as Failed, rolled back, then
 *   retried once when migration.auto_retry_after_recovery is set
 *
 * The legacy source is only ever read.
 */

#include "hsync/config/config.hpp"
#include "hsync/core/clock.hpp"
#include "hsync/events/event_bus.hpp"
#include "hsync/migration/observer.hpp"
#include "hsync/migration/session.hpp"
#include "hsync/migration/stores.hpp"
#include "hsync/streak/exception_calendar.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace hsync::migration {

class MigrationOrchestrator {
public:
    MigrationOrchestrator(const LegacySource& legacy,
                          NormalizedStore& store,
                          MigrationFlagStore& flags,
                          const streak::ExceptionCalendar& calendar,
                          EngineConfig config,
                          const Clock& clock,
                          events::EventBus* bus = nullptr,
                          MigrationObserver* observer = nullptr);

    /// Migrates migration.user_id from the config
    Result<MigrationSummary> migrate();

    Result<MigrationSummary> migrate(const std::string& user_id);

    /// Deletes everything a run created for `user_id` and clears its flag
    Result<std::size_t> rollback(const std::string& user_id);

    /// Summary of the most recent run, including failed ones
    std::optional<MigrationSummary> last_summary() const;

private:
    Result<MigrationSummary> run(const std::string& user_id, bool allow_recovery_retry);

    Result<std::size_t> rollback_locked(const std::string& user_id, const std::string& reason);

    Result<MigrationSummary> fail(MigrationSession& session, MigrationSummary& summary,
                                  const Error& error, bool roll_back,
                                  std::chrono::steady_clock::time_point started);

    void step(MigrationSession& session, MigrationPhase phase, int percent);
    void finish(MigrationSummary& summary, std::chrono::steady_clock::time_point started);

    template<typename EventType>
    void emit(const EventType& event) {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    const LegacySource& legacy_;
    NormalizedStore& store_;
    MigrationFlagStore& flags_;
    const streak::ExceptionCalendar& calendar_;
    EngineConfig config_;
    const Clock& clock_;
    events::EventBus* bus_;
    MigrationObserver* observer_;

    mutable std::mutex summary_mutex_;
    std::optional<MigrationSummary> last_summary_;
};

} // namespace hsync::migration
