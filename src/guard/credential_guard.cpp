#include "credential_guard.hpp"
#include "payload_envelope.hpp"
#include <fmt/format.h>
#include <exception>

CredentialGuard::CredentialGuard(SecureStore& store,
                                 Authenticator& authenticator,
                                 StorageAddress address,
                                 UiPrompt prompt,
                                 Clock clock,
                                 GuardObserver* observer)
    : store_(store),
      authenticator_(authenticator),
      address_(std::move(address)),
      prompt_(std::move(prompt)),
      policy_(AccessPolicy::biometric_or_passcode()),
      cache_(std::move(clock)),
      observer_(observer) {}

void CredentialGuard::emit(GuardEventKind kind, const std::string& message, int code) {
    if (observer_) observer_->on_event({kind, message, code});
}

bool CredentialGuard::is_available() {
    try {
        return authenticator_.can_evaluate(AccessPolicy::biometric_only());
    } catch (const std::exception& e) {
        emit(GuardEventKind::kAvailabilityProbeFailed, e.what());
        return false;
    }
}

bool CredentialGuard::has_stored_secret() {
    try {
        return store_.exists(address_);
    } catch (const std::exception& e) {
        emit(GuardEventKind::kAvailabilityProbeFailed,
             fmt::format("existence check for {} failed: {}", address_.describe(), e.what()));
        return false;
    }
}

Result<void, StoreError> CredentialGuard::store(const SecretBytes& secret) {
    using R = Result<void, StoreError>;

    auto removed = store_.remove(address_);
    if (removed.is_err()) {
        emit(GuardEventKind::kStoreFailed,
             fmt::format("could not clear previous item at {}: {}",
                         address_.describe(), removed.error.message),
             removed.error.code);
        return R::Err({StoreErrorKind::kStoreWriteFailed, removed.error.code, removed.error.message});
    }

    SecretBytes payload = encode_envelope(secret);
    auto written = store_.write(address_, payload, policy_);
    if (written.is_err()) {
        const auto& f = written.error;
        if (f.status == StoreStatus::kPolicyRejected) {
            emit(GuardEventKind::kStoreFailed,
                 fmt::format("access policy rejected ({}): {}", policy_.describe(), f.message),
                 f.code);
            return R::Err({StoreErrorKind::kPolicyConstructionFailed, f.code, f.message});
        }
        emit(GuardEventKind::kStoreFailed,
             fmt::format("write to {} failed: {}", address_.describe(), f.message), f.code);
        return R::Err({StoreErrorKind::kStoreWriteFailed, f.code, f.message});
    }

    emit(GuardEventKind::kStored,
         fmt::format("secret stored at {} ({})", address_.describe(), policy_.describe()));
    return R::Ok();
}

Result<SecretBytes, RetrieveError> CredentialGuard::retrieve() {
    using R = Result<SecretBytes, RetrieveError>;

    auto read = store_.read(address_, policy_, prompt_);
    if (read.is_err()) {
        const auto& f = read.error;
        switch (f.status) {
            case StoreStatus::kUserCancelled:
                emit(GuardEventKind::kRetrieveCancelled, "user cancelled authentication");
                return R::Err({RetrieveErrorKind::kUserCancelled, 0, f.message});
            case StoreStatus::kAuthFailed:
                emit(GuardEventKind::kRetrieveFailed, "authentication failed");
                return R::Err({RetrieveErrorKind::kAuthenticationFailed, 0, f.message});
            case StoreStatus::kNotFound:
                emit(GuardEventKind::kRetrieveFailed,
                     fmt::format("no secret stored at {}", address_.describe()));
                return R::Err({RetrieveErrorKind::kNotFound, 0, f.message});
            default:
                emit(GuardEventKind::kRetrieveFailed,
                     fmt::format("store error ({}): {}", to_string(f.status), f.message), f.code);
                return R::Err({RetrieveErrorKind::kStorageError, f.code, f.message});
        }
    }

    auto decoded = decode_envelope(read.value);
    read.value.wipe();
    if (decoded.is_err()) {
        emit(GuardEventKind::kRetrieveFailed, "stored payload is corrupt: " + decoded.error);
        return R::Err({RetrieveErrorKind::kPayloadCorrupt, 0, decoded.error});
    }

    cache_.record_success();
    emit(GuardEventKind::kRetrieved,
         fmt::format("secret retrieved from {}", address_.describe()));
    return R::Ok(std::move(decoded.value));
}

Result<void, StoreError> CredentialGuard::remove() {
    using R = Result<void, StoreError>;

    auto removed = store_.remove(address_);
    if (removed.is_err()) {
        emit(GuardEventKind::kDeleteFailed,
             fmt::format("delete of {} failed: {}", address_.describe(), removed.error.message),
             removed.error.code);
        return R::Err({StoreErrorKind::kStoreWriteFailed, removed.error.code, removed.error.message});
    }

    emit(GuardEventKind::kDeleted, fmt::format("secret at {} deleted", address_.describe()));
    return R::Ok();
}

Result<void, StoreError> CredentialGuard::reset_all() {
    cache_.clear();
    auto removed = remove();
    if (removed.is_ok()) {
        emit(GuardEventKind::kReset, "auth state and stored secret cleared");
    }
    return removed;
}

bool CredentialGuard::is_cache_valid() {
    bool had_entry = cache_.created_at().has_value();
    bool valid = cache_.is_valid();
    if (had_entry && !valid) {
        emit(GuardEventKind::kCacheExpired, "cached authentication expired");
    }
    return valid;
}
