#pragma once

#include "hsync/config/config.hpp"
#include "hsync/conflict/resolver.hpp"
#include "hsync/core/clock.hpp"
#include "hsync/events/event_bus.hpp"
#include "hsync/sync/stores.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hsync::sync {

struct SyncResult {
    std::size_t remote_change_count = 0;
    std::size_t local_change_count = 0;
    std::size_t conflicts_resolved = 0;
    std::vector<std::string> failed_records;   // queued for the next cycle
    std::vector<std::string> stuck_records;    // retry budget exhausted, dropped
    bool success = false;                      // every record persisted
};

/**
 * @brief One sync pass between the local and the remote store
 *
 * Remote changes since the checkpoint are paired with local pending changes by
 * id. Unpaired changes are adopted by the other side; pairs go through the
 * ConflictResolver and the merge is written to both sides.
 *
 * A failed remote fetch fails the pass and leaves the checkpoint alone. A
 * failed record write is kept in an in-memory retry queue and attempted again
 * on the next pass, up to sync.max_batch_retries times. When the failed write
 * came from a fetched remote change, the checkpoint stops just before that
 * change, so it is fetched again even by a new orchestrator instance.
 *
 * Events are delivered after the pass releases its lock; handlers may call
 * back into the orchestrator.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(LocalHabitStore& local,
                     RemoteHabitStore& remote,
                     const EngineConfig& config,
                     const Clock& clock,
                     events::EventBus* bus = nullptr);

    Result<SyncResult> sync();

    std::size_t pending_retry_count() const;

private:
    struct PendingWrite {
        model::HabitRecord record;
        int attempts = 0;
        bool from_remote = false;   // unadopted remote change, refetched each pass
    };

    Result<SyncResult> run_pass();
    Result<void> persist_both(const model::HabitRecord& record);
    void queue_retry(const model::HabitRecord& record, const Error& error, SyncResult& result);
    void report_resolution(const std::string& id, const conflict::ConflictResolutionResult& resolution);

    // Queued under the lock, delivered by sync() once it is released
    template<typename EventType>
    void emit(const EventType& event) {
        if (bus_ != nullptr) {
            deferred_events_.push_back([bus = bus_, event]() { bus->emit(event); });
        }
    }

    LocalHabitStore& local_;
    RemoteHabitStore& remote_;
    conflict::ConflictResolver resolver_;
    const Clock& clock_;
    events::EventBus* bus_;
    int max_batch_retries_;

    mutable std::mutex mutex_;
    std::map<std::string, PendingWrite> retries_;
    std::vector<std::function<void()>> deferred_events_;
};

} // namespace hsync::sync
