/**
 * @file sync_demo.cpp
 * @brief Two devices editing one habit, reconciled through a shared remote
 *
 * Device A renames the habit while device B changes its schedule and logs
 * progress on a different day. After both sync, each device holds the
 * rename, the new schedule, and both days of progress.
 */

#include "hsync/config/config.hpp"
#include "hsync/core/clock.hpp"
#include "hsync/events/components.hpp"
#include "hsync/events/event_bus.hpp"
#include "hsync/io/json_codec.hpp"
#include "hsync/sync/memory_stores.hpp"
#include "hsync/sync/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <initializer_list>
#include <iostream>

using namespace hsync;
using namespace std::chrono_literals;

namespace {

void run_pass(const char* device, sync::SyncOrchestrator& orchestrator) {
    auto result = orchestrator.sync();
    if (result.is_error()) {
        spdlog::error("[{}] sync failed: {}", device, result.error().describe());
        return;
    }
    spdlog::info("[{}] remote={} local={} conflicts={} failed={}",
                 device, result.value().remote_change_count, result.value().local_change_count,
                 result.value().conflicts_resolved, result.value().failed_records.size());
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::info);

    const Date today = *Date::parse("2025-03-10");
    FixedClock clock(today);

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    EngineConfig config;
    sync::InMemoryRemoteHabitStore remote(clock);
    sync::InMemoryLocalHabitStore device_a;
    sync::InMemoryLocalHabitStore device_b;
    sync::SyncOrchestrator sync_a(device_a, remote, config, clock, &bus);
    sync::SyncOrchestrator sync_b(device_b, remote, config, clock, &bus);

    // Both devices start from the same synced habit
    model::HabitRecord habit;
    habit.id = "habit-read";
    habit.name = "Read";
    habit.goal = "20 pages";
    habit.schedule = "Everyday";
    habit.start_date = today.add_days(-30);
    habit.created_at = habit.start_date.to_timestamp_utc();
    for (auto field : {model::HabitField::Name, model::HabitField::Schedule, model::HabitField::CompletionHistory}) {
        habit.touch(field, clock.now());
    }
    device_a.record_local_edit(habit);
    run_pass("A", sync_a);
    run_pass("B", sync_b);

    // Offline edits on both devices
    clock.advance(10min);
    model::HabitRecord on_a = *device_a.get(habit.id);
    on_a.name = "Read before bed";
    on_a.completion_history["2025-03-09"] = 20;
    on_a.touch(model::HabitField::Name, clock.now());
    on_a.touch(model::HabitField::CompletionHistory, clock.now());
    device_a.record_local_edit(on_a);

    clock.advance(5min);
    model::HabitRecord on_b = *device_b.get(habit.id);
    on_b.schedule = "Weekdays";
    on_b.completion_history["2025-03-10"] = 25;
    on_b.touch(model::HabitField::Schedule, clock.now());
    on_b.touch(model::HabitField::CompletionHistory, clock.now());
    device_b.record_local_edit(on_b);

    clock.advance(1min);
    run_pass("A", sync_a);
    clock.advance(1min);
    run_pass("B", sync_b);
    clock.advance(1min);
    run_pass("A", sync_a);

    for (const auto* device : {&device_a, &device_b}) {
        auto record = device->get(habit.id);
        if (record) {
            std::cout << io::habit_record_to_json(*record).dump(2) << std::endl;
        }
    }

    metrics.print_stats();
    return 0;
}
