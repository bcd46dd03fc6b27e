#pragma once

/**
 * @file memory_stores.hpp
 * @brief Thread-safe in-memory implementations of the migration boundaries
 *
 * Each store can be told to fail so that rollback and recovery paths run in
 * tests. Reads take a shared lock, writes an exclusive one.
 */

#include "hsync/migration/stores.hpp"

#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>

namespace hsync::migration {

class InMemoryLegacySource : public LegacySource {
public:
    Result<std::vector<model::HabitRecord>> load_habits(const std::string& user_id) const override {
        std::shared_lock lock(mutex_);
        if (fail_reads_) {
            return Err<std::vector<model::HabitRecord>>(ErrorCode::StoreFailure, "Legacy store unreadable");
        }
        auto it = habits_.find(user_id);
        if (it == habits_.end()) {
            return Ok(std::vector<model::HabitRecord>{});
        }
        return Ok(it->second);
    }

    Result<LegacyPointsSnapshot> load_points(const std::string& user_id) const override {
        std::shared_lock lock(mutex_);
        if (fail_reads_) {
            return Err<LegacyPointsSnapshot>(ErrorCode::StoreFailure, "Legacy store unreadable");
        }
        auto it = points_.find(user_id);
        if (it == points_.end()) {
            return Ok(LegacyPointsSnapshot{});
        }
        return Ok(it->second);
    }

    void set_habits(const std::string& user_id, std::vector<model::HabitRecord> habits) {
        std::unique_lock lock(mutex_);
        habits_[user_id] = std::move(habits);
    }

    void set_points(const std::string& user_id, LegacyPointsSnapshot points) {
        std::unique_lock lock(mutex_);
        points_[user_id] = std::move(points);
    }

    void fail_reads(bool fail) {
        std::unique_lock lock(mutex_);
        fail_reads_ = fail;
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<model::HabitRecord>> habits_;
    std::map<std::string, LegacyPointsSnapshot> points_;
    bool fail_reads_ = false;
};

class InMemoryNormalizedStore : public NormalizedStore {
public:
    Result<void> commit(const MigrationBatch& batch) override {
        std::unique_lock lock(mutex_);
        if (fail_commit_) {
            return Err<void>(ErrorCode::CommitFailed, "Commit rejected for user " + batch.user_id);
        }
        auto& data = users_[batch.user_id];
        for (const auto& habit : batch.habits) {
            data.habits[habit.id] = habit;
        }
        for (const auto& record : batch.progress) {
            data.progress[record.id] = record;
        }
        if (batch.streak) {
            data.streak = batch.streak;
        }
        if (batch.user_progress) {
            data.user_progress = batch.user_progress;
        }
        ++commits_;
        return Ok();
    }

    Result<std::size_t> remove(const RecordManifest& manifest) override {
        std::unique_lock lock(mutex_);
        if (fail_remove_) {
            return Err<std::size_t>(ErrorCode::StoreFailure, "Remove rejected");
        }
        auto it = users_.find(manifest.user_id);
        if (it == users_.end()) {
            return Ok(std::size_t{0});
        }
        auto& data = it->second;
        std::size_t removed = 0;

        std::set<std::string> removed_habits;
        for (const auto& id : manifest.habit_ids) {
            if (data.habits.erase(id) > 0) {
                removed_habits.insert(id);
                ++removed;
            }
        }
        for (const auto& id : manifest.progress_ids) {
            removed += data.progress.erase(id);
        }
        // Cascade: progress of a removed habit goes with it
        for (auto p = data.progress.begin(); p != data.progress.end();) {
            if (removed_habits.count(p->second.habit_id) > 0) {
                p = data.progress.erase(p);
                ++removed;
            } else {
                ++p;
            }
        }
        for (const auto& id : manifest.streak_ids) {
            if (data.streak && data.streak->id == id) {
                data.streak.reset();
                ++removed;
            }
        }
        for (const auto& id : manifest.user_progress_ids) {
            if (data.user_progress && data.user_progress->id == id) {
                removed += 1 + data.user_progress->transactions.size();
                data.user_progress.reset();
            }
        }
        if (data.habits.empty() && data.progress.empty() && !data.streak && !data.user_progress) {
            users_.erase(it);
        }
        return Ok(removed);
    }

    Result<std::size_t> remove_all_for_user(const std::string& user_id) override {
        std::unique_lock lock(mutex_);
        if (fail_remove_) {
            return Err<std::size_t>(ErrorCode::StoreFailure, "Remove rejected");
        }
        auto it = users_.find(user_id);
        if (it == users_.end()) {
            return Ok(std::size_t{0});
        }
        const std::size_t removed = count_locked(it->second);
        users_.erase(it);
        return Ok(removed);
    }

    Result<std::size_t> count_records(const std::string& user_id) const override {
        std::shared_lock lock(mutex_);
        auto it = users_.find(user_id);
        if (it == users_.end()) {
            return Ok(std::size_t{0});
        }
        return Ok(count_locked(it->second));
    }

    Result<MigrationBatch> load(const std::string& user_id) const override {
        std::shared_lock lock(mutex_);
        MigrationBatch batch;
        batch.user_id = user_id;
        auto it = users_.find(user_id);
        if (it == users_.end()) {
            return Ok(std::move(batch));
        }
        for (const auto& [id, habit] : it->second.habits) {
            batch.habits.push_back(habit);
        }
        for (const auto& [id, record] : it->second.progress) {
            batch.progress.push_back(record);
        }
        batch.streak = it->second.streak;
        batch.user_progress = it->second.user_progress;
        return Ok(std::move(batch));
    }

    std::size_t commit_count() const {
        std::shared_lock lock(mutex_);
        return commits_;
    }

    // Failure injection
    void fail_commit(bool fail) {
        std::unique_lock lock(mutex_);
        fail_commit_ = fail;
    }

    void fail_remove(bool fail) {
        std::unique_lock lock(mutex_);
        fail_remove_ = fail;
    }

private:
    struct UserData {
        std::map<std::string, model::NormalizedHabit> habits;
        std::map<std::string, model::DailyProgress> progress;
        std::optional<model::GlobalStreak> streak;
        std::optional<model::UserProgress> user_progress;
    };

    static std::size_t count_locked(const UserData& data) {
        std::size_t count = data.habits.size() + data.progress.size();
        if (data.streak) {
            ++count;
        }
        if (data.user_progress) {
            count += 1 + data.user_progress->transactions.size();
        }
        return count;
    }

    mutable std::shared_mutex mutex_;
    std::map<std::string, UserData> users_;
    std::size_t commits_ = 0;
    bool fail_commit_ = false;
    bool fail_remove_ = false;
};

class InMemoryMigrationFlagStore : public MigrationFlagStore {
public:
    Result<MigrationFlagState> state(const std::string& user_id) const override {
        std::shared_lock lock(mutex_);
        auto it = states_.find(user_id);
        if (it == states_.end()) {
            return Ok(MigrationFlagState{});
        }
        return Ok(it->second);
    }

    Result<void> record_manifest(const std::string& user_id, const RecordManifest& manifest) override {
        std::unique_lock lock(mutex_);
        states_[user_id].manifest = manifest;
        return Ok();
    }

    Result<void> mark_completed(const std::string& user_id, Timestamp when) override {
        std::unique_lock lock(mutex_);
        if (fail_mark_completed_) {
            return Err<void>(ErrorCode::StoreFailure, "Flag store rejected completion for " + user_id);
        }
        auto& state = states_[user_id];
        state.completed = true;
        state.completed_at = when;
        return Ok();
    }

    Result<void> clear(const std::string& user_id) override {
        std::unique_lock lock(mutex_);
        states_.erase(user_id);
        return Ok();
    }

    bool try_acquire(const std::string& user_id) override {
        std::unique_lock lock(mutex_);
        return latched_.insert(user_id).second;
    }

    void release(const std::string& user_id) override {
        std::unique_lock lock(mutex_);
        latched_.erase(user_id);
    }

    // Failure injection
    void fail_mark_completed(bool fail) {
        std::unique_lock lock(mutex_);
        fail_mark_completed_ = fail;
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, MigrationFlagState> states_;
    std::set<std::string> latched_;
    bool fail_mark_completed_ = false;
};

} // namespace hsync::migration
