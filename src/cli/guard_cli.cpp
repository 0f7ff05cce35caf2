#include "guard_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#ifdef __APPLE__
#  include <platform/keychain_store_macos.hpp>
#  include <platform/local_auth_macos.hpp>
#else
#  include <platform/file_secure_store.hpp>
#  include <platform/passcode_authenticator.hpp>
#endif
#include <readline/readline.h>
#include <readline/history.h>
#include <iostream>
#include <sstream>
#include <vector>
#include <cstdlib>
#include <fmt/format.h>

GuardCLI::GuardCLI() {
    auto result = reload();
    if (result.is_err()) {
        load_error_ = result.error;
    }
    register_secret_commands(*this);
    register_setup_commands(*this);
}

Result<void> GuardCLI::reload() {
    guard.reset();
    store.reset();
    authenticator.reset();

    auto config_result = Config::load();
    if (config_result.is_err()) {
        config.reset();
        load_error_ = config_result.error;
        return Result<void>::Err(config_result.error);
    }
    config = config_result.value;
    load_error_.clear();
    set_log_path(config->log_path());

#ifdef __APPLE__
    authenticator = std::make_unique<LocalAuthAuthenticator>();
    store = std::make_unique<KeychainSecureStore>();
#else
    PasscodeSettings settings;
    settings.verifier = config->auth().passcode_verifier;
    settings.max_attempts = config->auth().max_attempts;
    settings.lockout_seconds = config->auth().lockout_seconds;
    settings.lockout_file = get_config_dir() / PASSCODE_LOCKOUT_FILE;
    auto on_status = [](const std::string& msg) {
        std::cerr << theme::info(msg);
    };
    authenticator = std::make_unique<PasscodeAuthenticator>(
        settings, terminal_passcode_reader(), system_clock(), on_status);
    store = std::make_unique<FileSecureStore>(config->store_dir(), *authenticator);
#endif

    guard = std::make_unique<CredentialGuard>(
        *store, *authenticator,
        StorageAddress(config->item().service, config->item().account),
        UiPrompt{config->prompt().reason, config->prompt().cancel_label},
        system_clock(), &observer);

    credguard_log("info", fmt::format("guard ready for {}/{}",
                                      config->item().service, config->item().account));
    return Result<void>::Ok();
}

void GuardCLI::add_command(const std::string& name,
                           CommandHandler handler,
                           const std::string& help) {
    commands_[name] = {handler, help};
}

bool GuardCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

bool GuardCLI::require_guard() {
    if (!guard) {
        std::cout << theme::fail(load_error_.empty() ? "Configuration not loaded." : load_error_);
        std::cout << theme::step("Fix " + get_config_path().string() + " or run 'credguard init'.");
        exit_code = 1;
        return false;
    }
    return true;
}

void GuardCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        exit_code = 1;
        return;
    }

    exit_code = 0;
    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        credguard_log("error", fmt::format("command '{}' threw: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        exit_code = 1;
    }
}

void GuardCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Secret",  {"status", "store", "get", "delete", "reset"}},
        {"Setup",   {"init", "passcode"}},
        {"General", {"help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << theme::section(cat_name);
        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::TEAL << fmt::format("    {:<12}", name)
                      << theme::color::RESET << theme::dim(it->second.second) << "\n";
        }
    }
    std::cout << "\n";
}

void GuardCLI::run_shell() {
    add_command("help", [](GuardCLI& cli, const std::string&) { cli.print_help(); },
                "Show commands");
    add_command("quit", [](GuardCLI& cli, const std::string&) { cli.quit_requested = true; },
                "Leave the shell");
    add_command("exit", [](GuardCLI& cli, const std::string&) { cli.quit_requested = true; },
                "Leave the shell");

    std::cout << theme::banner(CREDGUARD_VERSION);
    if (!require_guard()) {
        std::cout << "\n";
    } else {
        std::cout << theme::kv("Item", guard->address().describe());
        std::cout << theme::kv("Policy", guard->policy().describe());
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = theme::color::TEAL + "credguard" + theme::color::RESET + "> ";
        char* raw = readline(prompt.c_str());
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        trim(line);
        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    // Leaving the shell ends the session; nothing cached survives it.
    clear_history();
}

std::optional<std::string> read_secret_input(const std::string& prompt) {
    if (platform::stdin_is_tty()) {
        return platform::read_hidden_line(prompt, PASSCODE_READ_TIMEOUT_MS);
    }
    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}
