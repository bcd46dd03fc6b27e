#include "hsync/core/error.hpp"

namespace hsync {

ErrorSeverity severity_of(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MalformedValue:
        case ErrorCode::InvalidDateKey:
            return ErrorSeverity::RecoverablePerRecord;
        case ErrorCode::PersistFailed:
            return ErrorSeverity::RecoverablePerCycle;
        case ErrorCode::MissingRule:
            return ErrorSeverity::ConfigurationGap;
        default:
            return ErrorSeverity::FatalToRun;
    }
}

ErrorSeverity Error::severity() const noexcept {
    return severity_of(code);
}

std::string Error::describe() const {
    return std::string(to_string(code)) + ": " + message;
}

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MalformedValue: return "malformed_value";
        case ErrorCode::InvalidDateKey: return "invalid_date_key";
        case ErrorCode::PersistFailed: return "persist_failed";
        case ErrorCode::RemoteFetchFailed: return "remote_fetch_failed";
        case ErrorCode::ValidationFailed: return "validation_failed";
        case ErrorCode::AlreadyMigrated: return "already_migrated";
        case ErrorCode::MigrationInProgress: return "migration_in_progress";
        case ErrorCode::InterruptedMigration: return "interrupted_migration";
        case ErrorCode::StoreFailure: return "store_failure";
        case ErrorCode::CommitFailed: return "commit_failed";
        case ErrorCode::MissingRule: return "missing_rule";
        case ErrorCode::IdentityMismatch: return "identity_mismatch";
        case ErrorCode::IllegalTransition: return "illegal_transition";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::ConfigError: return "config_error";
    }
    return "unknown";
}

const char* to_string(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::RecoverablePerRecord: return "recoverable_per_record";
        case ErrorSeverity::RecoverablePerCycle: return "recoverable_per_cycle";
        case ErrorSeverity::FatalToRun: return "fatal_to_run";
        case ErrorSeverity::ConfigurationGap: return "configuration_gap";
    }
    return "unknown";
}

} // namespace hsync
