#include "../guard_cli.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <guard/secret_bytes.hpp>
#include <platform/passcode_verifier.hpp>
#include <platform/terminal.hpp>
#include <iostream>

static void do_init(GuardCLI& cli, const std::string&) {
    bool existed = config_exists();
    auto result = create_default_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        cli.exit_code = 1;
        return;
    }
    if (existed) {
        std::cout << theme::info(get_config_path().string() + " already exists (unchanged).");
    } else {
        std::cout << theme::ok("Wrote " + get_config_path().string());
    }
    auto reloaded = cli.reload();
    if (reloaded.is_err()) {
        std::cout << theme::fail(reloaded.error);
    }
}

static void do_passcode(GuardCLI& cli, const std::string&) {
    if (!cli.config) {
        cli.require_guard();
        return;
    }
    if (!platform::stdin_is_tty()) {
        std::cout << theme::fail("Setting a passcode needs an interactive terminal.");
        cli.exit_code = 1;
        return;
    }

    // Changing an existing passcode needs the current one.
    if (!cli.config->auth().passcode_verifier.empty() && cli.authenticator) {
        AccessPolicy passcode_only;
        passcode_only.factors = {AuthFactor::kDevicePasscode};
        passcode_only.scope = EnrollmentScope::kAny;
        auto outcome = cli.authenticator->evaluate(
            passcode_only, UiPrompt{"Confirm your current passcode", cli.config->prompt().cancel_label});
        if (outcome == CeremonyOutcome::kCancelled) {
            std::cout << theme::info("Cancelled.");
            cli.exit_code = 2;
            return;
        }
        if (outcome != CeremonyOutcome::kSuccess) {
            std::cout << theme::fail("Current passcode not confirmed (" + to_string(outcome) + ").");
            cli.exit_code = 1;
            return;
        }
    }

    auto first = platform::read_hidden_line("    New passcode: ", PASSCODE_READ_TIMEOUT_MS);
    if (!first || first->empty()) {
        std::cout << theme::info("Cancelled.");
        cli.exit_code = 2;
        return;
    }
    auto second = platform::read_hidden_line("    Repeat passcode: ", PASSCODE_READ_TIMEOUT_MS);
    if (!second) {
        wipe_string(*first);
        std::cout << theme::info("Cancelled.");
        cli.exit_code = 2;
        return;
    }

    bool match = *first == *second;
    wipe_string(*second);
    if (!match) {
        wipe_string(*first);
        std::cout << theme::fail("Passcodes do not match.");
        cli.exit_code = 1;
        return;
    }

    auto verifier = make_passcode_verifier(*first);
    wipe_string(*first);
    if (verifier.is_err()) {
        std::cout << theme::fail(verifier.error);
        cli.exit_code = 1;
        return;
    }

    Config updated = *cli.config;
    updated.set_passcode_verifier(verifier.value);
    auto saved = updated.save_to(get_config_path());
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        cli.exit_code = 1;
        return;
    }

    auto reloaded = cli.reload();
    if (reloaded.is_err()) {
        std::cout << theme::fail(reloaded.error);
        cli.exit_code = 1;
        return;
    }
    std::cout << theme::ok("Device passcode set.");
}

void register_setup_commands(GuardCLI& cli) {
    cli.add_command("init", do_init, "Write the default configuration file");
    cli.add_command("passcode", do_passcode, "Set the device passcode factor");
}
