#include "../guard_cli.hpp"
#include "../theme.hpp"
#include <guard/secret_bytes.hpp>
#include <iostream>
#include <fmt/format.h>

static void do_status(GuardCLI& cli, const std::string&) {
    if (!cli.require_guard()) return;
    auto& guard = *cli.guard;

    std::cout << theme::section("Status");
    std::cout << theme::kv("Item", guard.address().describe());
    std::cout << theme::kv("Policy", guard.policy().describe());
    std::cout << theme::kv("Biometrics", theme::yes_no(guard.is_available()));
    std::cout << theme::kv("Ceremony", theme::yes_no(cli.authenticator->can_evaluate(guard.policy())));
    std::cout << theme::kv("Stored", theme::yes_no(guard.has_stored_secret()));
    std::cout << theme::kv("Cached auth", theme::yes_no(guard.is_cache_valid()));
    std::cout << "\n";
}

static void do_store(GuardCLI& cli, const std::string& arg) {
    if (!cli.require_guard()) return;
    if (!arg.empty()) {
        std::cout << theme::fail("Secrets are never taken from the command line.");
        std::cout << theme::step("Run 'store' with no arguments and enter it at the prompt.");
        cli.exit_code = 1;
        return;
    }

    auto& guard = *cli.guard;
    if (guard.has_stored_secret()) {
        std::cout << theme::info("Replacing the stored secret.");
    }

    auto input = read_secret_input("    Secret: ");
    if (!input) {
        std::cout << theme::info("Cancelled.");
        cli.exit_code = 2;
        return;
    }
    SecretBytes secret = SecretBytes::from_string(*input);
    wipe_string(*input);

    auto result = guard.store(secret);
    if (result.is_ok()) {
        std::cout << theme::ok("Secret stored (" + guard.policy().describe() + ")");
        return;
    }

    cli.exit_code = 1;
    std::cout << theme::fail(to_string(result.error));
    if (result.error.kind == StoreErrorKind::kPolicyConstructionFailed) {
        std::cout << theme::step("This device cannot enforce the access policy.");
        std::cout << theme::step("Set a device passcode with 'credguard passcode'.");
    }
}

static void do_get(GuardCLI& cli, const std::string&) {
    if (!cli.require_guard()) return;

    auto result = cli.guard->retrieve();
    if (result.is_ok()) {
        std::string text = result.value.to_string();
        result.value.wipe();
        std::cout << text << std::endl;
        wipe_string(text);
        return;
    }

    // Everything but the secret itself goes to stderr.
    const auto& err = result.error;
    cli.exit_code = err.is_user_cancellation() ? 2 : 1;
    switch (err.kind) {
        case RetrieveErrorKind::kUserCancelled:
            std::cerr << theme::info("Cancelled.");
            break;
        case RetrieveErrorKind::kAuthenticationFailed:
            std::cerr << theme::fail("Authentication failed.");
            break;
        case RetrieveErrorKind::kNotFound:
            std::cerr << theme::fail("No secret stored.");
            std::cerr << theme::step("Run 'credguard store' first.");
            break;
        case RetrieveErrorKind::kPayloadCorrupt:
            std::cerr << theme::fail("The stored secret is corrupt.");
            break;
        case RetrieveErrorKind::kStorageError:
            std::cerr << theme::fail(to_string(err));
            break;
    }
    if (err.needs_reprovision()) {
        std::cerr << theme::step("Run 'credguard delete', then 'credguard store' again.");
    }
}

static void do_delete(GuardCLI& cli, const std::string&) {
    if (!cli.require_guard()) return;
    auto result = cli.guard->remove();
    if (result.is_err()) {
        std::cout << theme::fail(to_string(result.error));
        cli.exit_code = 1;
        return;
    }
    std::cout << theme::ok("Stored secret deleted.");
}

static void do_reset(GuardCLI& cli, const std::string&) {
    if (!cli.require_guard()) return;
    auto result = cli.guard->reset_all();
    if (result.is_err()) {
        std::cout << theme::fail(to_string(result.error));
        cli.exit_code = 1;
        return;
    }
    std::cout << theme::ok("Cached authentication and stored secret cleared.");
}

void register_secret_commands(GuardCLI& cli) {
    cli.add_command("status", do_status, "Show availability, storage and cache state");
    cli.add_command("store", do_store, "Store a secret (replaces any existing one)");
    cli.add_command("get", do_get, "Authenticate and print the secret");
    cli.add_command("delete", do_delete, "Delete the stored secret");
    cli.add_command("reset", do_reset, "Clear cached authentication and delete the secret");
}
