#pragma once

#include "hsync/migration/types.hpp"

#include <optional>
#include <string>

namespace hsync::migration {

struct PointsMigration {
    model::UserProgress progress;
    std::size_t skipped_entries = 0;       // history entries with unreadable timestamps
    bool synthesized_initial = false;      // no history: one "Initial migration" entry
    bool balance_adjusted = false;         // history disagreed with the legacy total
    std::optional<int> ignored_stored_level;
};

/**
 * Legacy points -> ledger-backed UserProgress.
 *
 * Without history, exactly one transaction carries the whole total. With
 * history, the readable entries are kept and, when they do not add up to the
 * legacy total, one balancing transaction is appended. The level is always
 * derived from the total; a stored legacy level is never copied.
 */
PointsMigration migrate_points(const LegacyPointsSnapshot& legacy,
                               const std::string& user_id,
                               Timestamp migrated_at);

} // namespace hsync::migration
