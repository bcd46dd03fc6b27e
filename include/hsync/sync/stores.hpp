#pragma once

/**
 * @file stores.hpp
 * @brief Boundary interfaces the sync orchestrator reads and writes
 *
 * The concrete persistence and transport live outside the engine. Both
 * stores report failures as Result errors; the orchestrator decides whether a
 * failure is fatal to the pass (remote fetch) or retried next cycle (a
 * single record write).
 */

#include "hsync/core/date.hpp"
#include "hsync/core/result.hpp"
#include "hsync/model/habit_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hsync::sync {

/// Record as returned by the remote, with the server-assigned clock
struct RemoteRecord {
    model::HabitRecord record;
    Timestamp server_modified{};
};

class LocalHabitStore {
public:
    virtual ~LocalHabitStore() = default;

    virtual Result<std::vector<model::HabitRecord>> load_all() const = 0;

    /// Records edited locally since they were last synced
    virtual Result<std::vector<model::HabitRecord>> pending_changes() const = 0;

    virtual Result<void> save(const model::HabitRecord& record) = 0;
    virtual Result<void> remove(const std::string& id) = 0;

    /// Clears the pending flag for `id`
    virtual Result<void> mark_synced(const std::string& id) = 0;

    /// Last point up to which remote changes were incorporated
    virtual std::optional<Timestamp> checkpoint() const = 0;
    virtual Result<void> save_checkpoint(Timestamp checkpoint) = 0;
};

class RemoteHabitStore {
public:
    virtual ~RemoteHabitStore() = default;

    /// Changes with server_modified strictly after `checkpoint`, oldest first
    virtual Result<std::vector<RemoteRecord>> fetch_changes_since(const std::optional<Timestamp>& checkpoint) = 0;

    virtual Result<void> upsert(const model::HabitRecord& record) = 0;
};

} // namespace hsync::sync
