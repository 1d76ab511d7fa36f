#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string CYAN      = "\033[36m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string REVERSE   = "\033[7m";
    const std::string MARK_BG   = "\033[42m";   // green background for marked rows
    const std::string RESET     = "\033[0m";
}

// Screen control
namespace screen {
    const std::string CLEAR       = "\033[2J";
    const std::string HOME        = "\033[H";
    const std::string HIDE_CURSOR = "\033[?25l";
    const std::string SHOW_CURSOR = "\033[?25h";
    const std::string ALT_ON      = "\033[?1049h";
    const std::string ALT_OFF     = "\033[?1049l";
}

// Shorthand wrappers
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// ── Status indicators (stderr) ──────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "Error: " + color::RESET + msg + "\n";
}

// Key-description row for the usage screen
inline std::string kv(const std::string& key, const std::string& value) {
    return fmt::format("  {:<12}", key) + color::DIM + value + color::RESET + "\n";
}

} // namespace theme
