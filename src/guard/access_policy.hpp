#pragma once

#include <set>
#include <string>
#include <optional>

// Authentication factors a policy can admit.
enum class AuthFactor {
    kBiometric,
    kDevicePasscode,
};

// How admitted factors combine.
enum class Combinator {
    kAnd,   // every factor must be presented
    kOr,    // any one factor suffices
};

// When the stored item may be extracted at all.
enum class Accessibility {
    kWhenUnlockedThisDeviceOnly,
};

// Which biometric enrollment the item is bound to.
enum class EnrollmentScope {
    kAny,          // survives enrollment changes
    kCurrentSet,   // invalidated by any change to enrolled biometrics
};

using FactorSet = std::set<AuthFactor>;

// Declarative access-control rule attached to a stored item at write time
// and re-evaluated by the store on every read.
struct AccessPolicy {
    FactorSet factors;
    Combinator combinator = Combinator::kOr;
    Accessibility accessibility = Accessibility::kWhenUnlockedThisDeviceOnly;
    EnrollmentScope scope = EnrollmentScope::kCurrentSet;

    // Biometric (current enrollment) OR device passcode. Attached by store().
    static AccessPolicy biometric_or_passcode();

    // Biometric only. Probed by is_available().
    static AccessPolicy biometric_only();

    bool admits(AuthFactor factor) const;

    // Whether the given available factors could satisfy this policy.
    // An empty policy is never satisfiable.
    bool is_satisfiable_with(const FactorSet& available) const;

    // True when a change of biometric enrollment must invalidate the item.
    bool binds_enrollment() const;

    std::string describe() const;

    bool operator==(const AccessPolicy& other) const;
    bool operator!=(const AccessPolicy& other) const { return !(*this == other); }
};

std::string to_string(AuthFactor factor);
std::string to_string(Combinator combinator);
std::string to_string(Accessibility accessibility);
std::string to_string(EnrollmentScope scope);

std::optional<AuthFactor> parse_auth_factor(const std::string& s);
std::optional<Combinator> parse_combinator(const std::string& s);
std::optional<Accessibility> parse_accessibility(const std::string& s);
std::optional<EnrollmentScope> parse_enrollment_scope(const std::string& s);
