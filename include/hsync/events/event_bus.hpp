/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel for engine progress and diagnostics
 *
 * WHY THIS FILE EXISTS:
 * SyncOrchestrator and MigrationOrchestrator report conflicts, persist
 * failures, missing rules and migration phases as events (events.hpp).
 * LoggerComponent, MetricsComponent and application code subscribe to the
 * event types they care about; the orchestrators never know who listens.
 *
 * DELIVERY:
 * - Synchronous, in the thread that emits, in subscription order
 * - The orchestrators emit only after releasing their own locks, so a
 *   handler may query the orchestrator that emitted
 * - A handler throwing std::exception is logged; the rest still run
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<RecordPersistFailedEvent>([](const RecordPersistFailedEvent& e) {
 *     if (e.gave_up) alert(e.record_id);
 * });
 * SyncOrchestrator orchestrator(local, remote, config, clock, &bus);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace hsync::events {

using SubscriptionId = std::size_t;

class EventBus {
public:
    EventBus() = default;

    // Copying would duplicate every subscription
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Returns the id to pass to unsubscribe()
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        Subscription subscription;
        subscription.deliver = [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        subscription.id = id;
        channels_[key<EventType>()].push_back(std::move(subscription));
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto channel = channels_.find(key<EventType>());
        if (channel == channels_.end()) {
            return;
        }
        auto& subscriptions = channel->second;
        subscriptions.erase(std::remove_if(subscriptions.begin(), subscriptions.end(),
                                           [id](const Subscription& s) { return s.id == id; }),
                            subscriptions.end());
    }

    /**
     * @brief Deliver an event to the subscribers registered when emit() starts
     *
     * Subscriptions added by a handler take effect from the next emit.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<Subscription> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto channel = channels_.find(key<EventType>());
            if (channel == channels_.end()) {
                return;
            }
            snapshot = channel->second;
        }

        for (const auto& subscription : snapshot) {
            try {
                subscription.deliver(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] subscriber {} for {} threw: {}",
                              subscription.id, typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto channel = channels_.find(key<EventType>());
        return channel == channels_.end() ? 0 : channel->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
    }

private:
    struct Subscription {
        SubscriptionId id = 0;
        // Receives a pointer to the event type this subscription was keyed under
        std::function<void(const void*)> deliver;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::unordered_map<std::type_index, std::vector<Subscription>> channels_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace hsync::events
