#pragma once
#include <string>

#include <sys/ioctl.h>
#include <unistd.h>

/**
 * Minimal ANSI terminal helper.
 *
 * Provides:
 *   - color escape sequences for the end-of-run summary
 *   - automatic disabling via term::g_enabled (--no-color)
 *   - the clear-screen sequence used before every dashboard frame
 *   - window size and TTY queries
 */

namespace term {

inline bool g_enabled = true;

inline const char* reset()   { return g_enabled ? "\x1b[0m"  : ""; }
inline const char* bold()    { return g_enabled ? "\x1b[1m"  : ""; }
inline const char* red()     { return g_enabled ? "\x1b[31m" : ""; }
inline const char* green()   { return g_enabled ? "\x1b[32m" : ""; }
inline const char* yellow()  { return g_enabled ? "\x1b[33m" : ""; }

// Clear screen and home the cursor. Emitted regardless of g_enabled.
inline const char* clear_screen() { return "\x1b[2J\x1b[H"; }

inline bool stdout_is_tty() { return ::isatty(STDOUT_FILENO) == 1; }
inline bool stdin_is_tty()  { return ::isatty(STDIN_FILENO) == 1; }

/**
 * Current window size of stdout. Falls back to 80x24 when stdout is
 * not a terminal or the size is unknown.
 */
inline void window_size(int& cols, int& rows) {
    cols = 80;
    rows = 24;
    struct winsize w{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0) {
        if (w.ws_col > 0) cols = w.ws_col;
        if (w.ws_row > 0) rows = w.ws_row;
    }
}

inline std::string colorize(const std::string& s, const char* color) {
    if (!g_enabled) return s;
    return std::string(color) + s + reset();
}

} // namespace term
