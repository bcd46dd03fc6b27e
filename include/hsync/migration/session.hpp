#pragma once

#include "hsync/core/result.hpp"
#include "hsync/migration/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace hsync::migration {

/**
 * @brief Phase bookkeeping for one migration run
 *
 * Forward order: NotStarted -> ValidatingSource -> MigratingHabits ->
 * MigratingStreak -> MigratingPoints -> Validating -> Committed.
 * Any non-terminal phase may fail; only Failed may move to RolledBack.
 */
class MigrationSession {
public:
    explicit MigrationSession(std::string user_id);

    [[nodiscard]] const std::string& user_id() const noexcept { return user_id_; }
    [[nodiscard]] MigrationPhase phase() const noexcept { return phase_; }
    [[nodiscard]] const std::vector<MigrationPhase>& history() const noexcept { return history_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    /// Phase the run was in when it failed (NotStarted if it has not failed)
    [[nodiscard]] MigrationPhase failed_in() const noexcept { return failed_in_; }

    Result<void> transition_to(MigrationPhase next);
    Result<void> mark_failed(std::string error_message);

    [[nodiscard]] bool is_terminal() const noexcept;

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(MigrationPhase target) const noexcept;

    std::string user_id_;
    MigrationPhase phase_ = MigrationPhase::NotStarted;
    MigrationPhase failed_in_ = MigrationPhase::NotStarted;
    std::vector<MigrationPhase> history_;
    std::string last_error_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace hsync::migration
