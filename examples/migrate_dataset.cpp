/**
 * @file migrate_dataset.cpp
 * @brief Migrate one user's legacy habits from a JSON dataset
 *
 * USAGE:
 *   migrate_dataset <dataset.json> [--config engine.json] [--dry-run]
 *                   [--today yyyy-MM-dd] [--show-records]
 *
 * Prints the migration summary as JSON on stdout. With --show-records the
 * committed normalized records are printed as well. Exit code is 0 when the
 * run reached Committed, 1 otherwise.
 */

#include "hsync/config/config.hpp"
#include "hsync/core/clock.hpp"
#include "hsync/events/components.hpp"
#include "hsync/events/event_bus.hpp"
#include "hsync/io/json_codec.hpp"
#include "hsync/migration/memory_stores.hpp"
#include "hsync/migration/orchestrator.hpp"
#include "hsync/streak/exception_calendar.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>

using namespace hsync;
using json = nlohmann::json;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <dataset.json> [--config engine.json] [--dry-run] [--today yyyy-MM-dd] [--show-records]\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    std::string dataset_path = argv[1];
    std::string config_path;
    std::optional<Date> today;
    bool force_dry_run = false;
    bool show_records = false;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--dry-run") {
            force_dry_run = true;
        } else if (arg == "--today" && i + 1 < argc) {
            today = Date::parse(argv[++i]);
            if (!today) {
                std::cerr << "Invalid --today date: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--show-records") {
            show_records = true;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    EngineConfig config;
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (loaded.is_error()) {
            spdlog::error("Config: {}", loaded.error().describe());
            return 2;
        }
        config = loaded.value();
    }
    auto logging = apply_logging(config.logging);
    if (logging.is_error()) {
        spdlog::error("Config: {}", logging.error().describe());
        return 2;
    }
    if (force_dry_run) {
        config.migration.dry_run = true;
    }

    auto dataset = io::load_dataset(dataset_path);
    if (dataset.is_error()) {
        spdlog::error("Dataset: {}", dataset.error().describe());
        return 2;
    }
    if (config.migration.user_id.empty()) {
        config.migration.user_id = dataset.value().user_id;
    }
    const std::string user_id = config.migration.user_id;

    migration::InMemoryLegacySource legacy;
    legacy.set_habits(user_id, dataset.value().habits);
    legacy.set_points(user_id, dataset.value().points);

    migration::InMemoryNormalizedStore store;
    migration::InMemoryMigrationFlagStore flags;
    streak::NoExceptions calendar;

    std::unique_ptr<Clock> clock;
    if (today) {
        clock = std::make_unique<FixedClock>(*today);
    } else {
        clock = std::make_unique<SystemClock>();
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    migration::MigrationOrchestrator orchestrator(legacy, store, flags, calendar, config, *clock, &bus);
    auto result = orchestrator.migrate();

    auto summary = orchestrator.last_summary();
    if (summary) {
        std::cout << io::summary_to_json(*summary).dump(2) << std::endl;
    }

    if (show_records && result.is_ok() && !config.migration.dry_run) {
        auto committed = store.load(user_id);
        if (committed.is_error()) {
            spdlog::error("Reading committed records: {}", committed.error().describe());
            return 1;
        }
        std::cout << io::batch_to_json(committed.value()).dump(2) << std::endl;
    }

    metrics.print_stats();
    return result.is_ok() ? 0 : 1;
}
