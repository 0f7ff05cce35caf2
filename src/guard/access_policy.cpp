#include "access_policy.hpp"
#include <fmt/format.h>
#include <vector>

AccessPolicy AccessPolicy::biometric_or_passcode() {
    AccessPolicy p;
    p.factors = {AuthFactor::kBiometric, AuthFactor::kDevicePasscode};
    p.combinator = Combinator::kOr;
    p.accessibility = Accessibility::kWhenUnlockedThisDeviceOnly;
    p.scope = EnrollmentScope::kCurrentSet;
    return p;
}

AccessPolicy AccessPolicy::biometric_only() {
    AccessPolicy p;
    p.factors = {AuthFactor::kBiometric};
    p.combinator = Combinator::kOr;
    p.accessibility = Accessibility::kWhenUnlockedThisDeviceOnly;
    p.scope = EnrollmentScope::kCurrentSet;
    return p;
}

bool AccessPolicy::admits(AuthFactor factor) const {
    return factors.count(factor) > 0;
}

bool AccessPolicy::is_satisfiable_with(const FactorSet& available) const {
    if (factors.empty()) return false;

    if (combinator == Combinator::kOr) {
        for (auto f : factors) {
            if (available.count(f)) return true;
        }
        return false;
    }

    for (auto f : factors) {
        if (!available.count(f)) return false;
    }
    return true;
}

bool AccessPolicy::binds_enrollment() const {
    return scope == EnrollmentScope::kCurrentSet && admits(AuthFactor::kBiometric);
}

std::string AccessPolicy::describe() const {
    if (factors.empty()) return "(no factors)";

    std::vector<std::string> names;
    for (auto f : factors) names.push_back(to_string(f));

    std::string joiner = combinator == Combinator::kOr ? " or " : " and ";
    std::string out;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out += joiner;
        out += names[i];
    }
    return fmt::format("{}; {}; enrollment {}", out, to_string(accessibility), to_string(scope));
}

bool AccessPolicy::operator==(const AccessPolicy& other) const {
    return factors == other.factors &&
           combinator == other.combinator &&
           accessibility == other.accessibility &&
           scope == other.scope;
}

// ── String conversions ──────────────────────────────────────
// These names are persisted in item files; do not rename.

std::string to_string(AuthFactor factor) {
    switch (factor) {
        case AuthFactor::kBiometric:      return "biometric";
        case AuthFactor::kDevicePasscode: return "device_passcode";
    }
    return "unknown";
}

std::string to_string(Combinator combinator) {
    return combinator == Combinator::kAnd ? "and" : "or";
}

std::string to_string(Accessibility accessibility) {
    switch (accessibility) {
        case Accessibility::kWhenUnlockedThisDeviceOnly: return "when_unlocked_this_device_only";
    }
    return "unknown";
}

std::string to_string(EnrollmentScope scope) {
    return scope == EnrollmentScope::kCurrentSet ? "current_set" : "any";
}

std::optional<AuthFactor> parse_auth_factor(const std::string& s) {
    if (s == "biometric") return AuthFactor::kBiometric;
    if (s == "device_passcode") return AuthFactor::kDevicePasscode;
    return std::nullopt;
}

std::optional<Combinator> parse_combinator(const std::string& s) {
    if (s == "and") return Combinator::kAnd;
    if (s == "or") return Combinator::kOr;
    return std::nullopt;
}

std::optional<Accessibility> parse_accessibility(const std::string& s) {
    if (s == "when_unlocked_this_device_only") return Accessibility::kWhenUnlockedThisDeviceOnly;
    return std::nullopt;
}

std::optional<EnrollmentScope> parse_enrollment_scope(const std::string& s) {
    if (s == "current_set") return EnrollmentScope::kCurrentSet;
    if (s == "any") return EnrollmentScope::kAny;
    return std::nullopt;
}
