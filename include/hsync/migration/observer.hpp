#pragma once

#include "hsync/core/error.hpp"
#include "hsync/migration/types.hpp"

#include <string>

namespace hsync::migration {

/**
 * @brief Passive progress callbacks for a migration run
 *
 * Called synchronously from the migrating thread. Implementations must not
 * block; the orchestrator ignores what they do.
 */
class MigrationObserver {
public:
    virtual ~MigrationObserver() = default;

    virtual void on_progress(const std::string& step, int percent_complete) = 0;
    virtual void on_error(const Error& error) = 0;

    /// Final summary, success or not; carries the validation report
    virtual void on_complete(const MigrationSummary& summary) = 0;
};

} // namespace hsync::migration
