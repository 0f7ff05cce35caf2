#pragma once

#include <guard/authenticator.hpp>
#include <CoreFoundation/CoreFoundation.h>

// LocalAuthentication-backed probe and ceremony (Touch ID with passcode
// fallback). Paired with KeychainSecureStore, which runs its own ceremony,
// so evaluate() is only used by callers that authenticate without the store.
class LocalAuthAuthenticator : public Authenticator {
public:
    FactorSet supported_factors() const override;
    bool can_evaluate(const AccessPolicy& policy) override;
    CeremonyOutcome evaluate(const AccessPolicy& policy, const UiPrompt& prompt) override;
    std::string enrollment_id() const override;
};

// LAContext carrying prompt.reason and prompt.cancel_label, for use as
// kSecUseAuthenticationContext. Returned retained; release with CFRelease.
CFTypeRef create_auth_context(const UiPrompt& prompt);
