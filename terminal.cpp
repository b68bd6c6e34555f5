/*
 * TERMINAL
 */

#include "terminal.h"
#include "julia.h"

#include <cstdio>
#include <csignal>
#include <unistd.h>
#include <sys/ioctl.h>

// ═══════════════════════════════════════════════════════════════════════════
// TERMINAL SETUP
// ═══════════════════════════════════════════════════════════════════════════

TerminalGuard::TerminalGuard() {
    // Only touch termios if stdin is a TTY
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &orig_termios_) == 0) {
        struct termios raw = orig_termios_;
        raw.c_lflag &= ~(ECHO | ICANON);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        raw_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0;
    }

    fputs(ALT_BUFFER_ON CURSOR_HIDE CLEAR_SCREEN, stdout);
    fflush(stdout);
}

TerminalGuard::~TerminalGuard() {
    if (raw_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &orig_termios_);
    }
    fputs(RESET CURSOR_SHOW ALT_BUFFER_OFF, stdout);
    fflush(stdout);
}

void terminal_size(int& cols, int& rows) {
    struct winsize ws;
    if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0
            && ws.ws_col > 0 && ws.ws_row > 0) {
        cols = ws.ws_col;
        rows = ws.ws_row;
    } else {
        cols = 80;
        rows = 24;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// SIGNALS
// ═══════════════════════════════════════════════════════════════════════════

static std::atomic<bool>* g_cancel = nullptr;
static volatile sig_atomic_t resize_pending = 0;

static void cancel_handler(int) {
    // Lock-free atomic store is async-signal-safe
    if (g_cancel) g_cancel->store(true);
}

static void sigwinch_handler(int) {
    resize_pending = 1;
}

void install_signal_handlers(std::atomic<bool>& cancel) {
    g_cancel = &cancel;
    signal(SIGINT, cancel_handler);
    signal(SIGTERM, cancel_handler);
    signal(SIGWINCH, sigwinch_handler);
    // A closed pipe shows up as a failed write instead of killing us
    signal(SIGPIPE, SIG_IGN);
}

bool resize_requested() {
    if (!resize_pending) return false;
    resize_pending = 0;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// INPUT
// ═══════════════════════════════════════════════════════════════════════════

Key read_key() {
    char c;
    if (read(STDIN_FILENO, &c, 1) != 1) return KEY_NONE;

    if (c == 'q' || c == 'Q') return KEY_QUIT;
    if (c == 3) return KEY_QUIT;  // Ctrl+C with ISIG off
    if (c == 27) {
        // Bare ESC quits; arrow keys and other sequences are drained
        char seq;
        if (read(STDIN_FILENO, &seq, 1) != 1) return KEY_QUIT;
        while (read(STDIN_FILENO, &seq, 1) == 1) {}
        return KEY_OTHER;
    }
    return KEY_OTHER;
}
