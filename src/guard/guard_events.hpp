#pragma once

#include <string>

enum class GuardEventKind {
    kAvailabilityProbeFailed,
    kStored,
    kStoreFailed,
    kRetrieved,
    kRetrieveCancelled,
    kRetrieveFailed,
    kDeleted,
    kDeleteFailed,
    kReset,
    kCacheExpired,
};

// Structured record of something CredentialGuard did. Never carries secret bytes.
struct GuardEvent {
    GuardEventKind kind;
    std::string message;
    int code = 0;
};

const char* to_string(GuardEventKind kind);

// Failures worth surfacing in logs as errors. Cancellation is not one of them.
bool is_failure(GuardEventKind kind);

class GuardObserver {
public:
    virtual ~GuardObserver() = default;
    virtual void on_event(const GuardEvent& event) = 0;
};
