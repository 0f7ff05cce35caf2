#include "keychain_store_macos.hpp"
#include "local_auth_macos.hpp"
#include <Security/Security.h>
#include <CoreFoundation/CoreFoundation.h>
#include <fmt/format.h>

static CFStringRef cf_str(const std::string& s) {
    return CFStringCreateWithCString(kCFAllocatorDefault, s.c_str(), kCFStringEncodingUTF8);
}

static std::string status_message(OSStatus status) {
    CFStringRef msg = SecCopyErrorMessageString(status, nullptr);
    if (!msg) return fmt::format("OSStatus {}", static_cast<int>(status));
    char buf[256];
    std::string out = CFStringGetCString(msg, buf, sizeof(buf), kCFStringEncodingUTF8)
        ? std::string(buf) : fmt::format("OSStatus {}", static_cast<int>(status));
    CFRelease(msg);
    return out;
}

// Base query addressing one generic-password item. Caller releases.
static CFMutableDictionaryRef item_query(const StorageAddress& address) {
    CFStringRef cf_service = cf_str(address.service());
    CFStringRef cf_account = cf_str(address.account());

    CFMutableDictionaryRef query = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(query, kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(query, kSecAttrService, cf_service);
    CFDictionarySetValue(query, kSecAttrAccount, cf_account);

    CFRelease(cf_service);
    CFRelease(cf_account);
    return query;
}

static SecAccessControlCreateFlags access_flags(const AccessPolicy& policy) {
    SecAccessControlCreateFlags flags = 0;
    if (policy.admits(AuthFactor::kBiometric)) {
        flags |= policy.scope == EnrollmentScope::kCurrentSet
            ? kSecAccessControlBiometryCurrentSet
            : kSecAccessControlBiometryAny;
    }
    if (policy.admits(AuthFactor::kDevicePasscode)) {
        flags |= kSecAccessControlDevicePasscode;
    }
    if (policy.factors.size() > 1) {
        flags |= policy.combinator == Combinator::kOr ? kSecAccessControlOr : kSecAccessControlAnd;
    }
    return flags;
}

bool KeychainSecureStore::exists(const StorageAddress& address) {
    CFMutableDictionaryRef query = item_query(address);
    CFDictionarySetValue(query, kSecReturnData, kCFBooleanFalse);
    // Never show UI; a protected item then answers errSecInteractionNotAllowed.
    CFDictionarySetValue(query, kSecUseAuthenticationUI, kSecUseAuthenticationUISkip);

    OSStatus status = SecItemCopyMatching(query, nullptr);
    CFRelease(query);

    return status == errSecSuccess || status == errSecInteractionNotAllowed;
}

Result<void, StoreFailure> KeychainSecureStore::write(const StorageAddress& address,
                                                      const SecretBytes& payload,
                                                      const AccessPolicy& policy) {
    using R = Result<void, StoreFailure>;

    if (policy.factors.empty()) {
        return R::Err({StoreStatus::kPolicyRejected, 0, "policy admits no factors"});
    }

    CFErrorRef cf_error = nullptr;
    SecAccessControlRef access = SecAccessControlCreateWithFlags(
        kCFAllocatorDefault,
        kSecAttrAccessibleWhenUnlockedThisDeviceOnly,
        access_flags(policy),
        &cf_error);
    if (!access) {
        int code = cf_error ? static_cast<int>(CFErrorGetCode(cf_error)) : 0;
        if (cf_error) CFRelease(cf_error);
        return R::Err({StoreStatus::kPolicyRejected, code,
                       "cannot create access control for " + policy.describe()});
    }

    CFDataRef cf_payload = CFDataCreate(kCFAllocatorDefault,
                                        reinterpret_cast<const UInt8*>(payload.data()),
                                        static_cast<CFIndex>(payload.size()));

    CFMutableDictionaryRef query = item_query(address);
    CFDictionarySetValue(query, kSecValueData, cf_payload);
    CFDictionarySetValue(query, kSecAttrAccessControl, access);

    OSStatus status = SecItemAdd(query, nullptr);

    CFRelease(query);
    CFRelease(cf_payload);
    CFRelease(access);

    if (status != errSecSuccess) {
        return R::Err({StoreStatus::kOther, static_cast<int>(status), status_message(status)});
    }
    return R::Ok();
}

Result<void, StoreFailure> KeychainSecureStore::remove(const StorageAddress& address) {
    using R = Result<void, StoreFailure>;

    CFMutableDictionaryRef query = item_query(address);
    OSStatus status = SecItemDelete(query);
    CFRelease(query);

    if (status != errSecSuccess && status != errSecItemNotFound) {
        return R::Err({StoreStatus::kOther, static_cast<int>(status), status_message(status)});
    }
    return R::Ok();
}

CFMutableDictionaryRef keychain_read_query(const StorageAddress& address, const UiPrompt& prompt) {
    CFTypeRef context = create_auth_context(prompt);

    CFMutableDictionaryRef query = item_query(address);
    CFDictionarySetValue(query, kSecReturnData, kCFBooleanTrue);
    CFDictionarySetValue(query, kSecMatchLimit, kSecMatchLimitOne);
    CFDictionarySetValue(query, kSecUseAuthenticationContext, context);
    CFDictionarySetValue(query, kSecUseAuthenticationUI, kSecUseAuthenticationUIAllow);

    CFRelease(context);
    return query;
}

Result<SecretBytes, StoreFailure> KeychainSecureStore::read(const StorageAddress& address,
                                                            const AccessPolicy& /*policy*/,
                                                            const UiPrompt& prompt) {
    using R = Result<SecretBytes, StoreFailure>;

    CFMutableDictionaryRef query = keychain_read_query(address, prompt);

    CFTypeRef result = nullptr;
    OSStatus status = SecItemCopyMatching(query, &result);

    CFRelease(query);

    switch (status) {
        case errSecSuccess:
            break;
        case errSecUserCanceled:
            return R::Err({StoreStatus::kUserCancelled, static_cast<int>(status), "cancelled"});
        case errSecAuthFailed:
            return R::Err({StoreStatus::kAuthFailed, static_cast<int>(status), status_message(status)});
        case errSecItemNotFound:
            return R::Err({StoreStatus::kNotFound, static_cast<int>(status), "no keychain item"});
        default:
            return R::Err({StoreStatus::kOther, static_cast<int>(status), status_message(status)});
    }

    if (!result || CFGetTypeID(result) != CFDataGetTypeID()) {
        if (result) CFRelease(result);
        return R::Err({StoreStatus::kOther, static_cast<int>(errSecDecode), "unexpected result type"});
    }

    CFDataRef data = static_cast<CFDataRef>(result);
    SecretBytes secret(CFDataGetBytePtr(data), static_cast<size_t>(CFDataGetLength(data)));
    CFRelease(result);
    return R::Ok(std::move(secret));
}
