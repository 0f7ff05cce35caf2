#include <iostream>
#include <string>
#include "cli/guard_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

void print_usage() {
    std::cout << theme::banner(CREDGUARD_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    credguard"
              << theme::color::RESET << theme::color::DIM
              << "                 Open the interactive shell" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    credguard status"
              << theme::color::RESET << theme::color::DIM
              << "          Availability, storage and cache state" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    credguard store"
              << theme::color::RESET << theme::color::DIM
              << "           Store a secret (read from the terminal or stdin)" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    credguard get"
              << theme::color::RESET << theme::color::DIM
              << "             Authenticate and print the secret" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    credguard delete"
              << theme::color::RESET << theme::color::DIM
              << "          Delete the stored secret" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    credguard reset"
              << theme::color::RESET << theme::color::DIM
              << "           Forget this device" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    credguard init"
              << theme::color::RESET << theme::color::DIM
              << "            Write ~/.credguard/config.yaml" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    credguard passcode"
              << theme::color::RESET << theme::color::DIM
              << "        Set the device passcode factor" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    credguard --version   Show version\n"
              << "    credguard --help      Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        GuardCLI cli;

        if (argc == 1) {
            cli.run_shell();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << "credguard " << CREDGUARD_VERSION << "\n";
            return 0;
        }
        if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        }
        if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        std::string args;
        for (int i = 2; i < argc; i++) {
            if (!args.empty()) args += " ";
            args += argv[i];
        }
        cli.execute_command(cmd, args);
        return cli.exit_code;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
