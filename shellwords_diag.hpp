#ifndef SHELLWORDS_DIAG_HPP
#define SHELLWORDS_DIAG_HPP

#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <unistd.h>

#include "shellwords_colors.hpp"

namespace shwords {

// ─────────────────────────────────────────────────────────────
// Diagnostics for the front-end: "shellwords: <msg>" on stderr
// ─────────────────────────────────────────────────────────────

inline constexpr const char* kProgName = "shellwords";

// Color only when writing to a terminal-backed std::cerr.
inline void log_line(std::ostream& os, const char* level, const char* style, std::string_view msg) {
    const bool c = &os == &std::cerr && color_enabled(STDERR_FILENO);
    os << paint(std::string(kProgName) + ":", ansi::BOLD, c) << ' '
       << paint(level, style, c) << ' ' << msg << "\n";
}

inline void log_error(std::string_view msg, std::ostream& os = std::cerr) {
    log_line(os, "error:", ansi::FG_RED, msg);
}

inline void log_warn(std::string_view msg, std::ostream& os = std::cerr) {
    log_line(os, "warning:", ansi::FG_YELLOW, msg);
}

}

#endif // SHELLWORDS_DIAG_HPP
