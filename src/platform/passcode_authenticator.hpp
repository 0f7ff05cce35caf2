#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <guard/authenticator.hpp>

// Reads one passcode attempt. nullopt means the user cancelled.
using PasscodeReader = std::function<std::optional<std::string>(const std::string& prompt)>;

// Terminal reader with echo disabled. Esc, Ctrl-C, EOF and timeout cancel.
PasscodeReader terminal_passcode_reader();

struct PasscodeSettings {
    std::string verifier;     // see passcode_verifier.hpp; empty = no passcode set
    int max_attempts = 3;
    int lockout_seconds = 30;
    std::filesystem::path lockout_file;  // empty = lockout kept in memory only
};

// Device-passcode factor for hosts without a biometric sensor.
//
// A ceremony allows max_attempts tries. Exhausting them fails the ceremony
// and locks the authenticator out for lockout_seconds, during which
// can_evaluate() is false and evaluate() fails without prompting.
//
// With a lockout_file the deadline is written there (YAML, mode 0600) and
// read back on construction, so a new process honours an earlier lockout.
class PasscodeAuthenticator : public Authenticator {
public:
    explicit PasscodeAuthenticator(PasscodeSettings settings,
                                   PasscodeReader reader = terminal_passcode_reader(),
                                   Clock clock = system_clock(),
                                   StatusCallback on_status = nullptr);

    FactorSet supported_factors() const override;
    bool can_evaluate(const AccessPolicy& policy) override;
    CeremonyOutcome evaluate(const AccessPolicy& policy, const UiPrompt& prompt) override;

    // No biometric enrollment on this backend.
    std::string enrollment_id() const override { return ""; }

    bool is_locked_out() const;

private:
    void status(const std::string& msg) const;
    void load_lockout();
    void save_lockout(TimePoint until);
    void clear_lockout();

    PasscodeSettings settings_;
    PasscodeReader reader_;
    Clock clock_;
    StatusCallback on_status_;

    mutable std::mutex mutex_;
    std::optional<TimePoint> locked_until_;
};
