#pragma once

#include <guard/secure_store.hpp>
#include <CoreFoundation/CoreFoundation.h>

// Generic-password keychain items guarded by SecAccessControl.
// The keychain runs the ceremony itself; no Authenticator is consulted.
class KeychainSecureStore : public SecureStore {
public:
    bool exists(const StorageAddress& address) override;

    Result<void, StoreFailure> write(const StorageAddress& address,
                                     const SecretBytes& payload,
                                     const AccessPolicy& policy) override;

    Result<void, StoreFailure> remove(const StorageAddress& address) override;

    Result<SecretBytes, StoreFailure> read(const StorageAddress& address,
                                           const AccessPolicy& policy,
                                           const UiPrompt& prompt) override;
};

// SecItemCopyMatching query for one item's data. The ceremony UI is driven by
// an LAContext built from prompt. Caller releases.
CFMutableDictionaryRef keychain_read_query(const StorageAddress& address, const UiPrompt& prompt);
