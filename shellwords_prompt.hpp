#ifndef SHELLWORDS_PROMPT_HPP
#define SHELLWORDS_PROMPT_HPP

#include <string>
#include <cstdlib>
#include <unistd.h>

#include "shellwords_colors.hpp"

namespace shwords {

inline constexpr const char* kContinuationPrompt = "> ";

// ─────────────────────────────────────────────────────────────
// Optional env override
// ─────────────────────────────────────────────────────────────
inline const char* env_prompt_override() {
    const char* s = std::getenv("SHELLWORDS_PROMPT");
    return (s && *s) ? s : nullptr;
}

// ─────────────────────────────────────────────────────────────
// Readline wrapping for non-printing ANSI sequences
// (mark each ESC...[m sequence with \001 ... \002)
// ─────────────────────────────────────────────────────────────
inline std::string readline_wrap_nonprinting(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\x1b') {
            out.push_back('\001');
            do {
                out.push_back(s[i]);
                if (s[i] == 'm') break;
                ++i;
            } while (i < s.size());
            out.push_back('\002');
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────
// Prompt builder: "λ split → "
// Arrow color = green if the last line split cleanly else red.
// $SHELLWORDS_PROMPT, then the rc "prompt" setting, replace it.
// ─────────────────────────────────────────────────────────────
inline std::string build_prompt_plain(int last_status, const std::string& rc_prompt) {
    if (auto* env = env_prompt_override()) return std::string(env);
    if (!rc_prompt.empty()) return rc_prompt;

    if (!color_enabled()) return "λ split → ";

    const char* SEP = (last_status == 0) ? ansi::FG_GREEN : ansi::FG_RED;

    std::string p;
    p += ansi::BOLD; p += ansi::FG_CYAN; p += "λ"; p += ansi::RESET; p += " ";
    p += ansi::DIM; p += "split"; p += ansi::RESET;
    p += ansi::BOLD; p += SEP; p += " → "; p += ansi::RESET;
    return p;
}

inline std::string build_prompt_readline(int last_status, const std::string& rc_prompt) {
    return readline_wrap_nonprinting(build_prompt_plain(last_status, rc_prompt));
}

} // namespace shwords

#endif // SHELLWORDS_PROMPT_HPP
