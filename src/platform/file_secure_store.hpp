#pragma once

#include <filesystem>
#include <core/types.hpp>
#include <guard/authenticator.hpp>
#include <guard/secure_store.hpp>

namespace fs = std::filesystem;

// Items stored as YAML files under <root>/<service>/<account>.yaml, mode 0600.
//
// Each file carries the base64 payload, the access policy it was written
// with, the enrollment id captured at write time (when the policy binds to
// the current biometric enrollment), and a creation timestamp. The payload is
// only base64-encoded; at rest it is protected by the file mode alone.
//
// read() re-evaluates the stored policy through the authenticator, exactly
// once per call. An item whose bound enrollment no longer matches is deleted
// and reported as not found.
class FileSecureStore : public SecureStore {
public:
    FileSecureStore(fs::path root, Authenticator& authenticator, Clock clock = system_clock());

    bool exists(const StorageAddress& address) override;

    Result<void, StoreFailure> write(const StorageAddress& address,
                                     const SecretBytes& payload,
                                     const AccessPolicy& policy) override;

    Result<void, StoreFailure> remove(const StorageAddress& address) override;

    Result<SecretBytes, StoreFailure> read(const StorageAddress& address,
                                           const AccessPolicy& policy,
                                           const UiPrompt& prompt) override;

    fs::path item_path(const StorageAddress& address) const;

private:
    fs::path root_;
    Authenticator& authenticator_;
    Clock clock_;
};
