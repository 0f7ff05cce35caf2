#pragma once

#include <string>
#include <optional>

namespace platform {

// True when stdin is attached to a terminal.
bool stdin_is_tty();

// RAII guard for no-echo terminal input on fd (stdin by default).
// Constructor saves current mode, disables canonical mode, echo and signals.
// Destructor restores the saved mode. A non-terminal fd is left alone.
struct NoEchoGuard {
    explicit NoEchoGuard(int fd = 0);
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Read one line from fd with echo disabled. Bytes are kept as typed, so
// UTF-8 input survives; backspace removes one whole UTF-8 character.
// Returns nullopt on Esc, Ctrl-C, Ctrl-D, EOF or timeout.
std::optional<std::string> read_hidden_fd(int fd, int timeout_ms);

// Print prompt to stderr, read one line from stdin with echo disabled.
// Returns nullopt when the user presses Esc or Ctrl-C, on EOF, or on timeout.
// The caller owns wiping the returned string.
std::optional<std::string> read_hidden_line(const std::string& prompt, int timeout_ms);

} // namespace platform
