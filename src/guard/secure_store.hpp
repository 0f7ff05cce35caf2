#pragma once

#include <string>
#include <core/types.hpp>
#include "access_policy.hpp"
#include "secret_bytes.hpp"
#include "storage_address.hpp"

// Text shown by the authentication ceremony.
struct UiPrompt {
    std::string reason;
    std::string cancel_label;
};

enum class StoreStatus {
    kSuccess,
    kUserCancelled,
    kAuthFailed,
    kNotFound,
    kPolicyRejected,   // write only: the access policy cannot be constructed here
    kOther,            // any other platform status; see StoreFailure::code
};

struct StoreFailure {
    StoreStatus status = StoreStatus::kOther;
    int code = 0;          // raw platform code, preserved for diagnostics
    std::string message;
};

std::string to_string(StoreStatus status);

// Persistent, capability-backed key/value store holding items addressed by
// (service, account), each protected by an access policy attached at write time.
//
// The store owns enforcement: read() runs exactly one authentication ceremony
// against the item's policy. Implementations are not required to be
// thread-safe; callers serialize access per address.
class SecureStore {
public:
    virtual ~SecureStore() = default;

    // Metadata-only lookup. Must never trigger an authentication ceremony.
    virtual bool exists(const StorageAddress& address) = 0;

    // Adds a new item. Fails with kPolicyRejected when the policy cannot be
    // built on this platform.
    virtual Result<void, StoreFailure> write(const StorageAddress& address,
                                             const SecretBytes& payload,
                                             const AccessPolicy& policy) = 0;

    // Removes the item. Absence is success.
    virtual Result<void, StoreFailure> remove(const StorageAddress& address) = 0;

    // Authenticates the user, then returns the payload. May block for as long
    // as the ceremony is on screen.
    virtual Result<SecretBytes, StoreFailure> read(const StorageAddress& address,
                                                   const AccessPolicy& policy,
                                                   const UiPrompt& prompt) = 0;
};
