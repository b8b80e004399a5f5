#ifndef SHELLWORDS_COLORS_HPP
#define SHELLWORDS_COLORS_HPP

#include <string>
#include <unistd.h>
#include <cstdlib>
#include <string_view>

namespace shwords {

namespace ansi {

// ─────────────────────────────────────────────────────────────
// Style Sequences
// ─────────────────────────────────────────────────────────────

inline constexpr const char* RESET    = "\x1b[0m";
inline constexpr const char* BOLD     = "\x1b[1m";
inline constexpr const char* DIM      = "\x1b[2m";

// ─────────────────────────────────────────────────────────────
// Foreground
// ─────────────────────────────────────────────────────────────

inline constexpr const char* FG_RED     = "\x1b[31m";
inline constexpr const char* FG_GREEN   = "\x1b[32m";
inline constexpr const char* FG_YELLOW  = "\x1b[33m";
inline constexpr const char* FG_CYAN    = "\x1b[36m";

}

// ─────────────────────────────────────────────────────────────
// Helper: Check if color should be enabled on fd
// ─────────────────────────────────────────────────────────────
inline bool color_enabled(int fd = STDOUT_FILENO) {
    if (!isatty(fd)) return false;
    if (std::getenv("NO_COLOR")) return false;
    const char* term = std::getenv("TERM");
    if (term && std::string_view(term) == "dumb") return false;
    return true;
}

// Wrap text in a style when enabled, else return it unchanged.
inline std::string paint(std::string_view text, const char* style, bool enabled) {
    if (!enabled) return std::string(text);
    std::string out;
    out.reserve(text.size() + 16);
    out += style;
    out += text;
    out += ansi::RESET;
    return out;
}

}

#endif // SHELLWORDS_COLORS_HPP
