#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <guard/credential_guard.hpp>
#include <guard/log_observer.hpp>

class GuardCLI {
public:
    GuardCLI();

    using CommandHandler = std::function<void(GuardCLI&, const std::string&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);
    bool has_command(const std::string& name) const;

    // (Re)load configuration and rebuild store, authenticator and guard.
    // Drops any cached authentication.
    Result<void> reload();

    bool require_guard();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Interactive shell. One guard lives for the whole session, so the
    // advisory auth cache carries across commands.
    void run_shell();

    // Public state
    std::optional<Config> config;
    std::unique_ptr<Authenticator> authenticator;
    std::unique_ptr<SecureStore> store;
    std::unique_ptr<CredentialGuard> guard;
    LogObserver observer;
    bool quit_requested = false;
    int exit_code = 0;   // set by commands: 0 ok, 1 failure, 2 cancelled

private:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::string load_error_;
};

void register_secret_commands(GuardCLI& cli);
void register_setup_commands(GuardCLI& cli);

// Read a secret with echo disabled, or a line from stdin when not a terminal.
// nullopt on cancel or EOF.
std::optional<std::string> read_secret_input(const std::string& prompt);
