#pragma once

#include "hsync/core/date.hpp"
#include "hsync/migration/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hsync::migration {

struct ValidationInputs {
    std::size_t legacy_habit_count = 0;
    std::size_t rejected_habit_count = 0;
    std::size_t legacy_progress_entries = 0;
    std::size_t skipped_date_keys = 0;
    std::int64_t legacy_total_points = 0;
    std::vector<std::string> decoder_warnings;
    Date today;
    int unusual_date_past_days = 730;
    int unusual_date_future_days = 365;
};

/**
 * Runs every invariant check on a batch before it is committed. A failed
 * check is a hard error; decoder fallbacks and out-of-window progress dates
 * are only warnings.
 */
ValidationReport validate_batch(const MigrationBatch& batch, const ValidationInputs& inputs);

} // namespace hsync::migration
