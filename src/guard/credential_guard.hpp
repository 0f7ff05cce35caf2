#pragma once

#include <core/types.hpp>
#include "access_policy.hpp"
#include "auth_cache.hpp"
#include "authenticator.hpp"
#include "errors.hpp"
#include "guard_events.hpp"
#include "secret_bytes.hpp"
#include "secure_store.hpp"
#include "storage_address.hpp"

// Policy layer over one biometric-protected secret.
//
// Decides when the caller must re-authenticate, how the secret is protected
// at rest, and surfaces every failure mode as a distinct error. The store and
// authenticator are borrowed and must outlive the guard.
//
// Construct one per process and pass it by reference. No internal locking
// beyond the auth cache: callers serialize operations on the guard
// themselves (see RetrievalWorker for a single in-flight request helper).
// retrieve() blocks while the ceremony is on screen, so UI-owning threads
// must call it from a worker.
class CredentialGuard {
public:
    CredentialGuard(SecureStore& store,
                    Authenticator& authenticator,
                    StorageAddress address,
                    UiPrompt prompt,
                    Clock clock = system_clock(),
                    GuardObserver* observer = nullptr);

    CredentialGuard(const CredentialGuard&) = delete;
    CredentialGuard& operator=(const CredentialGuard&) = delete;

    // Biometric evaluation possible right now. Never prompts, never touches
    // the cache. Errors fold into false.
    bool is_available();

    // Presence check. Metadata only; never prompts. Errors fold into false.
    bool has_stored_secret();

    // Replaces any stored secret (delete, then add) under the
    // biometric-or-passcode policy. Does not touch the auth cache.
    Result<void, StoreError> store(const SecretBytes& secret);

    // Runs exactly one authentication ceremony (inside the store) and
    // returns the secret. Records a cache hit on success only. Never retries.
    Result<SecretBytes, RetrieveError> retrieve();

    // Removes the stored secret. Absence is success.
    Result<void, StoreError> remove();

    // Clears the auth cache and removes the stored secret ("sign out").
    // The cache is cleared even when removal fails.
    Result<void, StoreError> reset_all();

    // Informational only; does not bypass the store's authentication.
    bool is_cache_valid();

    const StorageAddress& address() const { return address_; }
    const AccessPolicy& policy() const { return policy_; }
    const UiPrompt& prompt() const { return prompt_; }

private:
    void emit(GuardEventKind kind, const std::string& message, int code = 0);

    SecureStore& store_;
    Authenticator& authenticator_;
    const StorageAddress address_;
    const UiPrompt prompt_;
    const AccessPolicy policy_;
    AuthCache cache_;
    GuardObserver* observer_;
};
