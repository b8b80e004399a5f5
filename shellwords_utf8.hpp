#ifndef SHELLWORDS_UTF8_HPP
#define SHELLWORDS_UTF8_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace shwords {

inline constexpr char32_t kRuneError = 0xFFFD;
inline constexpr char32_t kMaxRune   = 0x10FFFF;

// A decoded code point and the number of input bytes it occupied.
struct Rune {
    char32_t value = kRuneError;
    size_t length = 0;
};

// ─────────────────────────────────────────────────────────────
// Decode the first code point of s.
//   ""                         -> { U+FFFD, 0 }
//   malformed / truncated /
//   overlong / surrogate       -> { U+FFFD, 1 }
// ─────────────────────────────────────────────────────────────
inline Rune decode_rune(std::string_view s) {
    if (s.empty()) return {kRuneError, 0};

    const auto b0 = static_cast<unsigned char>(s[0]);
    if (b0 < 0x80) return {b0, 1};

    size_t need;
    char32_t cp;
    char32_t min;
    if ((b0 & 0xE0) == 0xC0)      { need = 2; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { need = 3; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { need = 4; cp = b0 & 0x07; min = 0x10000; }
    else return {kRuneError, 1};

    if (s.size() < need) return {kRuneError, 1};

    for (size_t i = 1; i < need; ++i) {
        const auto b = static_cast<unsigned char>(s[i]);
        if ((b & 0xC0) != 0x80) return {kRuneError, 1};
        cp = (cp << 6) | (b & 0x3F);
    }

    if (cp < min || cp > kMaxRune) return {kRuneError, 1};
    if (cp >= 0xD800 && cp <= 0xDFFF) return {kRuneError, 1};
    return {cp, need};
}

// Whether the UTF-8 string `set` holds the code point c.
inline bool contains_rune(std::string_view set, char32_t c) {
    while (!set.empty()) {
        Rune r = decode_rune(set);
        if (r.value == c) return true;
        set.remove_prefix(r.length);
    }
    return false;
}

// ─────────────────────────────────────────────────────────────
// Trimming
// ─────────────────────────────────────────────────────────────

// Strip leading and trailing code points found in cutset.
inline std::string_view trim_runes(std::string_view s, std::string_view cutset) {
    while (!s.empty()) {
        Rune r = decode_rune(s);
        if (!contains_rune(cutset, r.value)) break;
        s.remove_prefix(r.length);
    }

    // Walk back to the start byte of the last code point.
    while (!s.empty()) {
        size_t start = s.size() - 1;
        while (start > 0 && s.size() - start < 4 &&
               (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80)
            --start;
        Rune r = decode_rune(s.substr(start));
        if (r.length != s.size() - start) {
            // Stray continuation byte: treat it as a one-byte error rune.
            start = s.size() - 1;
            r = {kRuneError, 1};
        }
        if (!contains_rune(cutset, r.value)) break;
        s.remove_suffix(r.length);
    }
    return s;
}

inline bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string_view trim_ascii_space(std::string_view s) {
    while (!s.empty() && is_ascii_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_ascii_space(s.back()))  s.remove_suffix(1);
    return s;
}

} // namespace shwords

#endif // SHELLWORDS_UTF8_HPP
