#pragma once

#include <stdexcept>
#include <string>

namespace hs::sync {

struct SyncError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Scan root missing or unreadable. Fatal.
struct ScanError : SyncError {
    using SyncError::SyncError;
};

// Log file unreadable or without a single valid message. Per-file.
struct HashError : SyncError {
    using SyncError::SyncError;
};

// Remote rejected the upload, or the transport gave up. Per-file.
struct DeliveryError : SyncError {
    explicit DeliveryError(const std::string& what, const long status = 0)
        : SyncError(what), httpStatus(status) {}

    long httpStatus; // 0 when no HTTP response was received
};

// No usable bearer credential. Fatal.
struct CredentialError : SyncError {
    using SyncError::SyncError;
};

// State file present but unreadable or unparseable. Fatal.
struct StateError : SyncError {
    using SyncError::SyncError;
};

// Final state save failed. Fatal.
struct PersistError : SyncError {
    using SyncError::SyncError;
};

struct CancelledError : SyncError {
    CancelledError() : SyncError("Operation cancelled") {}
};

}
