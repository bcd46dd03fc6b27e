#include "hsync/model/normalized.hpp"

#include <cmath>
#include <numeric>

namespace hsync::model {

std::int64_t points_required_for_level(int level) {
    return static_cast<std::int64_t>(level) * 1000;
}

// Sum of k * 1000 for k < level, i.e. 500 * level * (level - 1)
std::int64_t cumulative_points_for_level(int level) {
    if (level <= 1) {
        return 0;
    }
    const auto lvl = static_cast<std::int64_t>(level);
    return 500 * lvl * (lvl - 1);
}

int level_for_points(std::int64_t total_points) {
    if (total_points <= 0) {
        return 1;
    }
    // Highest L with L * (L - 1) <= total / 500; the estimate is corrected in integers
    const std::int64_t budget = total_points / 500;
    auto level = static_cast<std::int64_t>((1.0 + std::sqrt(1.0 + 4.0 * static_cast<double>(budget))) / 2.0);
    while (level > 1 && level * (level - 1) > budget) {
        --level;
    }
    while ((level + 1) * level <= budget) {
        ++level;
    }
    return static_cast<int>(level);
}

std::int64_t UserProgress::ledger_sum() const {
    return std::accumulate(transactions.begin(), transactions.end(), std::int64_t{0},
                           [](std::int64_t acc, const PointTransaction& t) { return acc + t.amount; });
}

std::int64_t UserProgress::points_into_level() const {
    return total_points - cumulative_points_for_level(level);
}

std::int64_t UserProgress::points_for_next_level() const {
    return points_required_for_level(level);
}

} // namespace hsync::model
