#pragma once

#include <string>

namespace hsync {

/**
 * @brief Error taxonomy shared by the sync and migration paths
 *
 * The code decides how a caller reacts: per-record errors are counted and
 * skipped, per-cycle errors are retried on the next sync, fatal errors abort
 * the current run (and roll back a migration).
 */
enum class ErrorCode {
    MalformedValue,
    InvalidDateKey,
    PersistFailed,
    RemoteFetchFailed,
    ValidationFailed,
    AlreadyMigrated,
    MigrationInProgress,
    InterruptedMigration,
    StoreFailure,
    CommitFailed,
    MissingRule,
    IdentityMismatch,
    IllegalTransition,
    NotFound,
    ConfigError
};

enum class ErrorSeverity {
    RecoverablePerRecord,
    RecoverablePerCycle,
    FatalToRun,
    ConfigurationGap
};

struct Error {
    ErrorCode code = ErrorCode::StoreFailure;
    std::string message;

    [[nodiscard]] ErrorSeverity severity() const noexcept;
    [[nodiscard]] std::string describe() const;
};

const char* to_string(ErrorCode code) noexcept;
const char* to_string(ErrorSeverity severity) noexcept;

ErrorSeverity severity_of(ErrorCode code) noexcept;

} // namespace hsync
