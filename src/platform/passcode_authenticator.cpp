#include "passcode_authenticator.hpp"
#include "passcode_verifier.hpp"
#include "terminal.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <guard/secret_bytes.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

PasscodeReader terminal_passcode_reader() {
    return [](const std::string& prompt) -> std::optional<std::string> {
        if (!platform::stdin_is_tty()) return std::nullopt;
        return platform::read_hidden_line(prompt, PASSCODE_READ_TIMEOUT_MS);
    };
}

PasscodeAuthenticator::PasscodeAuthenticator(PasscodeSettings settings,
                                             PasscodeReader reader,
                                             Clock clock,
                                             StatusCallback on_status)
    : settings_(std::move(settings)),
      reader_(std::move(reader)),
      clock_(std::move(clock)),
      on_status_(std::move(on_status)) {
    if (settings_.max_attempts <= 0) settings_.max_attempts = DEFAULT_MAX_ATTEMPTS;
    if (settings_.lockout_seconds < 0) settings_.lockout_seconds = DEFAULT_LOCKOUT_SECS;
    if (!settings_.verifier.empty() && !is_well_formed_verifier(settings_.verifier)) {
        credguard_log("warn", "ignoring malformed passcode verifier; run 'credguard passcode'");
        settings_.verifier.clear();
    }
    load_lockout();
}

// ── Persisted lockout ───────────────────────────────────────

void PasscodeAuthenticator::load_lockout() {
    const auto& path = settings_.lockout_file;
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return;

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root["locked_until"]) return;
        auto until = TimePoint(std::chrono::seconds(root["locked_until"].as<int64_t>()));
        std::lock_guard<std::mutex> lock(mutex_);
        locked_until_ = until;
    } catch (const YAML::Exception& e) {
        credguard_log("warn", fmt::format("ignoring unreadable {}: {}", path.string(), e.what()));
    }
}

void PasscodeAuthenticator::save_lockout(TimePoint until) {
    const auto& path = settings_.lockout_file;
    if (path.empty()) return;

    // Round up so a reloaded deadline is never earlier than the in-memory one.
    auto secs = std::chrono::ceil<std::chrono::seconds>(until.time_since_epoch()).count();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "locked_until" << YAML::Value << static_cast<int64_t>(secs);
    out << YAML::EndMap;

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f || !platform::restrict_to_owner(tmp)) {
            credguard_log("warn", "cannot persist passcode lockout to " + path.string());
            fs::remove(tmp, ec);
            return;
        }
        f << out.c_str() << "\n";
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        credguard_log("warn", fmt::format("cannot persist passcode lockout: {}", ec.message()));
        fs::remove(tmp, ec);
    }
}

void PasscodeAuthenticator::clear_lockout() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        locked_until_.reset();
    }
    if (settings_.lockout_file.empty()) return;
    std::error_code ec;
    fs::remove(settings_.lockout_file, ec);
    if (ec) {
        credguard_log("warn", fmt::format("cannot clear passcode lockout: {}", ec.message()));
    }
}

FactorSet PasscodeAuthenticator::supported_factors() const {
    return {AuthFactor::kDevicePasscode};
}

void PasscodeAuthenticator::status(const std::string& msg) const {
    if (on_status_) on_status_(msg);
}

bool PasscodeAuthenticator::is_locked_out() const {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_until_ && now < *locked_until_;
}

bool PasscodeAuthenticator::can_evaluate(const AccessPolicy& policy) {
    if (settings_.verifier.empty()) return false;
    if (!policy.is_satisfiable_with(supported_factors())) return false;
    return !is_locked_out();
}

CeremonyOutcome PasscodeAuthenticator::evaluate(const AccessPolicy& policy, const UiPrompt& prompt) {
    if (settings_.verifier.empty() || !policy.is_satisfiable_with(supported_factors())) {
        return CeremonyOutcome::kUnavailable;
    }
    if (is_locked_out()) {
        status("Too many failed attempts. Try again later.");
        return CeremonyOutcome::kFailed;
    }

    status(prompt.reason);
    std::string label = fmt::format("    Passcode (Esc or empty Enter to {}): ",
                                    prompt.cancel_label.empty() ? "cancel" : prompt.cancel_label);

    for (int attempt = 1; attempt <= settings_.max_attempts; attempt++) {
        auto input = reader_(label);
        if (!input || input->empty()) {
            return CeremonyOutcome::kCancelled;
        }

        bool ok = check_passcode(settings_.verifier, *input);
        wipe_string(*input);
        if (ok) {
            clear_lockout();
            return CeremonyOutcome::kSuccess;
        }

        int left = settings_.max_attempts - attempt;
        if (left > 0) {
            status(fmt::format("Incorrect passcode, {} attempt{} left.", left, left == 1 ? "" : "s"));
        }
    }

    auto until = clock_() + std::chrono::seconds(settings_.lockout_seconds);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        locked_until_ = until;
    }
    save_lockout(until);
    status("Too many failed attempts. Try again later.");
    return CeremonyOutcome::kFailed;
}
