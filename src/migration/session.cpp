#include "hsync/migration/session.hpp"

#include <algorithm>
#include <map>

namespace hsync::migration {
namespace {

bool is_progressive(MigrationPhase current, MigrationPhase target) {
    static const std::map<MigrationPhase, std::vector<MigrationPhase>> transitions {
        {MigrationPhase::NotStarted, {MigrationPhase::ValidatingSource}},
        {MigrationPhase::ValidatingSource, {MigrationPhase::MigratingHabits}},
        {MigrationPhase::MigratingHabits, {MigrationPhase::MigratingStreak}},
        {MigrationPhase::MigratingStreak, {MigrationPhase::MigratingPoints}},
        {MigrationPhase::MigratingPoints, {MigrationPhase::Validating}},
        {MigrationPhase::Validating, {MigrationPhase::Committed}},
        {MigrationPhase::Failed, {MigrationPhase::RolledBack}},
    };

    if (target == MigrationPhase::Failed) {
        return current != MigrationPhase::NotStarted;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

MigrationSession::MigrationSession(std::string user_id)
    : user_id_(std::move(user_id)), last_transition_(std::chrono::system_clock::now()) {
    history_.push_back(phase_);
}

Result<void> MigrationSession::transition_to(MigrationPhase next) {
    if (phase_ == next) {
        return Ok();
    }
    if (!can_transition(next)) {
        return Err<void>(ErrorCode::IllegalTransition,
                         std::string("Illegal migration transition ") + to_string(phase_) + " -> " + to_string(next));
    }

    if (next == MigrationPhase::Failed) {
        failed_in_ = phase_;
    }
    phase_ = next;
    history_.push_back(next);
    last_transition_ = std::chrono::system_clock::now();
    return Ok();
}

Result<void> MigrationSession::mark_failed(std::string error_message) {
    last_error_ = std::move(error_message);
    return transition_to(MigrationPhase::Failed);
}

bool MigrationSession::is_terminal() const noexcept {
    return phase_ == MigrationPhase::Committed || phase_ == MigrationPhase::RolledBack;
}

bool MigrationSession::can_transition(MigrationPhase target) const noexcept {
    if (phase_ == target) {
        return true;
    }
    if (is_terminal()) {
        return false;
    }
    return is_progressive(phase_, target);
}

} // namespace hsync::migration
