#pragma once

/**
 * @file memory_stores.hpp
 * @brief Thread-safe in-memory local and remote habit stores
 *
 * WHY THIS FILE EXISTS:
 * The engine only sees the LocalHabitStore / RemoteHabitStore interfaces.
 * These implementations back the tests and the sync demo, and can be told to
 * fail on purpose so that partial-failure handling is exercised.
 *
 * THREAD SAFETY PATTERN:
 * - Reads take a std::shared_lock (many concurrent readers)
 * - Writes take a std::unique_lock (exclusive)
 *
 * EXAMPLE USAGE:
 * InMemoryLocalHabitStore local;
 * local.record_local_edit(habit);           // saved and marked pending
 *
 * FixedClock server_clock(...);
 * InMemoryRemoteHabitStore remote(server_clock);
 * remote.fail_upserts_for("habit-1");        // next upserts of habit-1 fail
 */

#include "hsync/core/clock.hpp"
#include "hsync/sync/stores.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>

namespace hsync::sync {

class InMemoryLocalHabitStore : public LocalHabitStore {
public:
    InMemoryLocalHabitStore() = default;

    Result<std::vector<model::HabitRecord>> load_all() const override {
        std::shared_lock lock(mutex_);
        std::vector<model::HabitRecord> out;
        out.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            out.push_back(record);
        }
        return Ok(std::move(out));
    }

    Result<std::vector<model::HabitRecord>> pending_changes() const override {
        std::shared_lock lock(mutex_);
        if (fail_pending_reads_) {
            return Err<std::vector<model::HabitRecord>>(ErrorCode::StoreFailure,
                                                        "Local store unavailable");
        }
        std::vector<model::HabitRecord> out;
        for (const auto& id : pending_) {
            auto it = records_.find(id);
            if (it != records_.end()) {
                out.push_back(it->second);
            }
        }
        return Ok(std::move(out));
    }

    Result<void> save(const model::HabitRecord& record) override {
        std::unique_lock lock(mutex_);
        if (failing_saves_.count(record.id) > 0) {
            return Err<void>(ErrorCode::PersistFailed, "Local save failed for " + record.id);
        }
        records_[record.id] = record;
        return Ok();
    }

    Result<void> remove(const std::string& id) override {
        std::unique_lock lock(mutex_);
        if (records_.erase(id) == 0) {
            return Err<void>(ErrorCode::NotFound, "No local habit " + id);
        }
        pending_.erase(id);
        return Ok();
    }

    Result<void> mark_synced(const std::string& id) override {
        std::unique_lock lock(mutex_);
        pending_.erase(id);
        return Ok();
    }

    std::optional<Timestamp> checkpoint() const override {
        std::shared_lock lock(mutex_);
        return checkpoint_;
    }

    Result<void> save_checkpoint(Timestamp checkpoint) override {
        std::unique_lock lock(mutex_);
        checkpoint_ = checkpoint;
        return Ok();
    }

    /// A user edit on this device: saved and queued for the next sync
    void record_local_edit(const model::HabitRecord& record) {
        std::unique_lock lock(mutex_);
        records_[record.id] = record;
        pending_.insert(record.id);
    }

    std::optional<model::HabitRecord> get(const std::string& id) const {
        std::shared_lock lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t pending_count() const {
        std::shared_lock lock(mutex_);
        return pending_.size();
    }

    // Failure injection
    void fail_saves_for(const std::string& id) {
        std::unique_lock lock(mutex_);
        failing_saves_.insert(id);
    }

    void fail_pending_reads(bool fail) {
        std::unique_lock lock(mutex_);
        fail_pending_reads_ = fail;
    }

    void clear_failures() {
        std::unique_lock lock(mutex_);
        failing_saves_.clear();
        fail_pending_reads_ = false;
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, model::HabitRecord> records_;
    std::set<std::string> pending_;
    std::optional<Timestamp> checkpoint_;

    std::set<std::string> failing_saves_;
    bool fail_pending_reads_ = false;
};

/**
 * @brief Remote replica that stamps each write with its own clock
 *
 * The stamp is the server_modified returned by fetch_changes_since() and is
 * never earlier than the previous stamp, so checkpoints move forward.
 */
class InMemoryRemoteHabitStore : public RemoteHabitStore {
public:
    explicit InMemoryRemoteHabitStore(const Clock& clock) : clock_(clock) {}

    Result<std::vector<RemoteRecord>> fetch_changes_since(const std::optional<Timestamp>& checkpoint) override {
        std::unique_lock lock(mutex_);
        ++fetch_calls_;
        if (fail_fetch_) {
            return Err<std::vector<RemoteRecord>>(ErrorCode::RemoteFetchFailed, "Remote unreachable");
        }
        std::vector<RemoteRecord> out;
        for (const auto& [id, entry] : records_) {
            if (!checkpoint || entry.server_modified > *checkpoint) {
                out.push_back(entry);
            }
        }
        std::sort(out.begin(), out.end(), [](const RemoteRecord& a, const RemoteRecord& b) {
            return a.server_modified < b.server_modified;
        });
        return Ok(std::move(out));
    }

    Result<void> upsert(const model::HabitRecord& record) override {
        std::unique_lock lock(mutex_);
        if (failing_upserts_.count(record.id) > 0) {
            return Err<void>(ErrorCode::PersistFailed, "Remote upsert failed for " + record.id);
        }
        store_locked(record);
        return Ok();
    }

    /// A write arriving from another device
    void put_from_other_device(const model::HabitRecord& record) {
        std::unique_lock lock(mutex_);
        store_locked(record);
    }

    std::optional<RemoteRecord> get(const std::string& id) const {
        std::shared_lock lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t fetch_calls() const {
        std::shared_lock lock(mutex_);
        return fetch_calls_;
    }

    // Failure injection
    void fail_fetch(bool fail) {
        std::unique_lock lock(mutex_);
        fail_fetch_ = fail;
    }

    void fail_upserts_for(const std::string& id) {
        std::unique_lock lock(mutex_);
        failing_upserts_.insert(id);
    }

    void clear_failures() {
        std::unique_lock lock(mutex_);
        fail_fetch_ = false;
        failing_upserts_.clear();
    }

private:
    void store_locked(const model::HabitRecord& record) {
        Timestamp stamp = clock_.now();
        if (stamp <= last_stamp_) {
            stamp = last_stamp_ + std::chrono::milliseconds(1);
        }
        last_stamp_ = stamp;
        records_[record.id] = RemoteRecord{record, stamp};
    }

    const Clock& clock_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, RemoteRecord> records_;
    Timestamp last_stamp_{};
    std::size_t fetch_calls_ = 0;

    bool fail_fetch_ = false;
    std::set<std::string> failing_upserts_;
};

} // namespace hsync::sync
