#include "hsync/migration/points.hpp"

#include <spdlog/spdlog.h>

namespace hsync::migration {
namespace {

std::string transaction_id(const std::string& user_id, std::size_t index) {
    return "txn:" + user_id + ":" + std::to_string(index);
}

} // namespace

PointsMigration migrate_points(const LegacyPointsSnapshot& legacy,
                               const std::string& user_id,
                               Timestamp migrated_at) {
    PointsMigration out;
    model::UserProgress& progress = out.progress;
    progress.id = "progress:" + user_id;
    progress.user_id = user_id;

    auto append = [&](std::int64_t amount, std::string reason, Timestamp when) {
        model::PointTransaction transaction;
        transaction.id = transaction_id(user_id, progress.transactions.size());
        transaction.user_id = user_id;
        transaction.amount = amount;
        transaction.reason = std::move(reason);
        transaction.timestamp = when;
        progress.transactions.push_back(std::move(transaction));
    };

    if (legacy.history.empty()) {
        append(legacy.total_points, "Initial migration", migrated_at);
        out.synthesized_initial = true;
    } else {
        for (const auto& entry : legacy.history) {
            auto when = parse_timestamp(entry.timestamp);
            if (!when) {
                spdlog::warn("[Migration] user={} skipping points entry with timestamp '{}'",
                             user_id, entry.timestamp);
                ++out.skipped_entries;
                continue;
            }
            append(entry.amount, entry.reason, *when);
        }
        const std::int64_t difference = legacy.total_points - progress.ledger_sum();
        if (difference != 0) {
            spdlog::warn("[Migration] user={} points history sums to {} but total is {}; appending adjustment",
                         user_id, progress.ledger_sum(), legacy.total_points);
            append(difference, "Migration balance adjustment", migrated_at);
            out.balance_adjusted = true;
        }
    }

    progress.total_points = progress.ledger_sum();
    progress.level = model::level_for_points(progress.total_points);

    if (legacy.stored_level && *legacy.stored_level != progress.level) {
        spdlog::warn("[Migration] user={} stored level {} ignored; derived level is {}",
                     user_id, *legacy.stored_level, progress.level);
        out.ignored_stored_level = legacy.stored_level;
    }
    return out;
}

} // namespace hsync::migration
