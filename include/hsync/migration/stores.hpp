#pragma once

/**
 * @file stores.hpp
 * @brief Boundary interfaces used by the migration orchestrator
 *
 * LegacySource is read-only: the migration never writes to the legacy
 * schema, whatever the outcome. NormalizedStore must apply a whole batch or
 * nothing. MigrationFlagStore lives outside the normalized records and holds
 * the completion flag, the manifest of the current run, and the in-process
 * latch that keeps two runs for one user apart.
 */

#include "hsync/core/result.hpp"
#include "hsync/migration/types.hpp"
#include "hsync/model/habit_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hsync::migration {

class LegacySource {
public:
    virtual ~LegacySource() = default;

    virtual Result<std::vector<model::HabitRecord>> load_habits(const std::string& user_id) const = 0;
    virtual Result<LegacyPointsSnapshot> load_points(const std::string& user_id) const = 0;
};

class NormalizedStore {
public:
    virtual ~NormalizedStore() = default;

    /// All records of the batch in one durable transaction
    virtual Result<void> commit(const MigrationBatch& batch) = 0;

    /// Deletes every listed record, cascading to progress of deleted habits
    virtual Result<std::size_t> remove(const RecordManifest& manifest) = 0;

    virtual Result<std::size_t> remove_all_for_user(const std::string& user_id) = 0;

    virtual Result<std::size_t> count_records(const std::string& user_id) const = 0;

    virtual Result<MigrationBatch> load(const std::string& user_id) const = 0;
};

struct MigrationFlagState {
    bool completed = false;
    std::optional<Timestamp> completed_at;
    std::optional<RecordManifest> manifest;
};

class MigrationFlagStore {
public:
    virtual ~MigrationFlagStore() = default;

    virtual Result<MigrationFlagState> state(const std::string& user_id) const = 0;
    virtual Result<void> record_manifest(const std::string& user_id, const RecordManifest& manifest) = 0;
    virtual Result<void> mark_completed(const std::string& user_id, Timestamp when) = 0;

    /// Drops the flag and the manifest
    virtual Result<void> clear(const std::string& user_id) = 0;

    virtual bool try_acquire(const std::string& user_id) = 0;
    virtual void release(const std::string& user_id) = 0;
};

/// Holds the per-user migration latch for its lifetime
class MigrationLatch {
public:
    MigrationLatch(MigrationFlagStore& flags, std::string user_id)
        : flags_(flags), user_id_(std::move(user_id)), acquired_(flags_.try_acquire(user_id_)) {}

    ~MigrationLatch() {
        if (acquired_) {
            flags_.release(user_id_);
        }
    }

    MigrationLatch(const MigrationLatch&) = delete;
    MigrationLatch& operator=(const MigrationLatch&) = delete;

    bool acquired() const noexcept { return acquired_; }

private:
    MigrationFlagStore& flags_;
    std::string user_id_;
    bool acquired_;
};

} // namespace hsync::migration
