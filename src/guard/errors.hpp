#pragma once

#include <string>

enum class StoreErrorKind {
    kPolicyConstructionFailed,
    kStoreWriteFailed,
};

struct StoreError {
    StoreErrorKind kind = StoreErrorKind::kStoreWriteFailed;
    int code = 0;
    std::string message;
};

enum class RetrieveErrorKind {
    kUserCancelled,
    kAuthenticationFailed,
    kNotFound,
    kPayloadCorrupt,
    kStorageError,
};

struct RetrieveError {
    RetrieveErrorKind kind = RetrieveErrorKind::kStorageError;
    int code = 0;
    std::string message;

    // Cancellation is an expected outcome; callers should not show an error.
    bool is_user_cancellation() const { return kind == RetrieveErrorKind::kUserCancelled; }

    // Corrupt payloads are fixed by deleting and re-provisioning, not by retrying.
    bool needs_reprovision() const { return kind == RetrieveErrorKind::kPayloadCorrupt; }
};

std::string to_string(StoreErrorKind kind);
std::string to_string(RetrieveErrorKind kind);
std::string to_string(const StoreError& error);
std::string to_string(const RetrieveError& error);
