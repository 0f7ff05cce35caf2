#pragma once

#include <string>
#include "access_policy.hpp"
#include "secure_store.hpp"

enum class CeremonyOutcome {
    kSuccess,
    kFailed,       // presented but rejected, or locked out after too many attempts
    kCancelled,    // the user dismissed the ceremony
    kUnavailable,  // the policy cannot be evaluated right now
};

std::string to_string(CeremonyOutcome outcome);

// Evaluates access policies against the live user.
class Authenticator {
public:
    virtual ~Authenticator() = default;

    // Factors this device can ever provide, enrolled or not.
    virtual FactorSet supported_factors() const = 0;

    // Whether the policy can be evaluated right now (hardware present,
    // enrolled, not locked out). Never prompts, no side effects.
    virtual bool can_evaluate(const AccessPolicy& policy) = 0;

    // Runs one ceremony. Blocks on user interaction.
    virtual CeremonyOutcome evaluate(const AccessPolicy& policy, const UiPrompt& prompt) = 0;

    // Opaque identifier of the current biometric enrollment set.
    // Empty when no biometrics are enrolled.
    virtual std::string enrollment_id() const = 0;
};
