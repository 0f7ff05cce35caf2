#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <iostream>

namespace platform {

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    int fd = STDIN_FILENO;
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard(int fd) : impl_(new Impl) {
    impl_->fd = fd;
    if (tcgetattr(fd, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    raw.c_lflag &= ~(ICANON | ECHO | ISIG);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(fd, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->saved)
            tcsetattr(impl_->fd, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── poll_fd ──────────────────────────────────────────────────

// True if fd has data to read within timeout_ms.
static bool poll_fd(int fd, int timeout_ms) {
    struct pollfd pfd = {fd, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

// ── read_hidden_line ─────────────────────────────────────────

// Drop the last UTF-8 character: trailing continuation bytes, then the lead byte.
static void erase_last_char(std::string& line) {
    while (!line.empty() && (static_cast<unsigned char>(line.back()) & 0xC0) == 0x80) {
        line.pop_back();
    }
    if (!line.empty()) line.pop_back();
}

std::optional<std::string> read_hidden_fd(int fd, int timeout_ms) {
    NoEchoGuard guard(fd);

    std::string line;
    bool cancelled = false;
    // Read byte by byte (no echo, no canonical)
    while (true) {
        if (!poll_fd(fd, timeout_ms)) { cancelled = true; break; }
        char c;
        if (read(fd, &c, 1) != 1) { cancelled = true; break; }
        unsigned char b = static_cast<unsigned char>(c);
        if (b == '\n' || b == '\r') break;
        if (b == 27 || b == 3 || b == 4) { cancelled = true; break; }  // Esc, Ctrl-C, Ctrl-D
        if (b == 127 || b == 8) {  // backspace
            erase_last_char(line);
            continue;
        }
        if (b >= 32) line += c;
    }

    if (cancelled) {
        tcflush(fd, TCIFLUSH);
        line.assign(line.size(), '\0');
        return std::nullopt;
    }
    return line;
}

std::optional<std::string> read_hidden_line(const std::string& prompt, int timeout_ms) {
    // Prompts go to stderr so stdout stays clean for piped secrets.
    std::cerr << prompt;
    std::cerr.flush();

    auto line = read_hidden_fd(STDIN_FILENO, timeout_ms);
    std::cerr << "\n";
    return line;
}

} // namespace platform
