/*
 * TERMINAL
 * Raw-mode setup/teardown, signal flags and key polling for the driver.
 */

#pragma once

#include <atomic>
#include <termios.h>

// Scoped terminal session: raw-ish stdin, alternate screen, hidden cursor.
// Everything is undone by the destructor, whichever way the loop exits.
class TerminalGuard {
public:
    TerminalGuard();
    ~TerminalGuard();

    // stdin switched to non-blocking key reads
    bool interactive() const { return raw_; }

    TerminalGuard(const TerminalGuard&) = delete;
    TerminalGuard& operator=(const TerminalGuard&) = delete;

private:
    struct termios orig_termios_;
    bool raw_ = false;
};

// Columns and rows of the controlling terminal; 80x24 when not a TTY.
void terminal_size(int& cols, int& rows);

// SIGINT/SIGTERM store true into `cancel`; SIGWINCH raises resize_requested();
// SIGPIPE is ignored.
// `cancel` must outlive the handlers.
void install_signal_handlers(std::atomic<bool>& cancel);

// True once after each SIGWINCH.
bool resize_requested();

enum Key {
    KEY_NONE = 0,
    KEY_QUIT,
    KEY_OTHER
};

// Non-blocking; q, ESC and Ctrl+C map to KEY_QUIT.
Key read_key();
