#include "errors.hpp"
#include "authenticator.hpp"
#include "secure_store.hpp"
#include <fmt/format.h>

std::string to_string(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::kPolicyConstructionFailed: return "PolicyConstructionFailed";
        case StoreErrorKind::kStoreWriteFailed:         return "StoreWriteFailed";
    }
    return "Unknown";
}

std::string to_string(RetrieveErrorKind kind) {
    switch (kind) {
        case RetrieveErrorKind::kUserCancelled:        return "UserCancelled";
        case RetrieveErrorKind::kAuthenticationFailed: return "AuthenticationFailed";
        case RetrieveErrorKind::kNotFound:             return "NotFound";
        case RetrieveErrorKind::kPayloadCorrupt:       return "PayloadCorrupt";
        case RetrieveErrorKind::kStorageError:         return "StorageError";
    }
    return "Unknown";
}

std::string to_string(const StoreError& error) {
    std::string out = to_string(error.kind);
    if (error.kind == StoreErrorKind::kStoreWriteFailed)
        out += fmt::format("({})", error.code);
    if (!error.message.empty())
        out += ": " + error.message;
    return out;
}

std::string to_string(const RetrieveError& error) {
    std::string out = to_string(error.kind);
    if (error.kind == RetrieveErrorKind::kStorageError)
        out += fmt::format("({})", error.code);
    if (!error.message.empty())
        out += ": " + error.message;
    return out;
}

std::string to_string(StoreStatus status) {
    switch (status) {
        case StoreStatus::kSuccess:        return "success";
        case StoreStatus::kUserCancelled:  return "user_cancelled";
        case StoreStatus::kAuthFailed:     return "auth_failed";
        case StoreStatus::kNotFound:       return "not_found";
        case StoreStatus::kPolicyRejected: return "policy_rejected";
        case StoreStatus::kOther:          return "other";
    }
    return "unknown";
}

std::string to_string(CeremonyOutcome outcome) {
    switch (outcome) {
        case CeremonyOutcome::kSuccess:     return "success";
        case CeremonyOutcome::kFailed:      return "failed";
        case CeremonyOutcome::kCancelled:   return "cancelled";
        case CeremonyOutcome::kUnavailable: return "unavailable";
    }
    return "unknown";
}
