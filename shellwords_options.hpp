#ifndef SHELLWORDS_OPTIONS_HPP
#define SHELLWORDS_OPTIONS_HPP

#include <optional>
#include <string>
#include <vector>

namespace shwords {

// ─────────────────────────────────────────────────────────────
// Defaults match /bin/sh
// ─────────────────────────────────────────────────────────────
inline constexpr const char* kDefaultSplitChars        = " \n\t";
inline constexpr char32_t    kDefaultSingleChar        = U'\'';
inline constexpr char32_t    kDefaultDoubleChar        = U'"';
inline constexpr char32_t    kDefaultEscapeChar        = U'\\';
inline constexpr const char* kDefaultDoubleEscapeChars = "$`\"\n\\";

// escape_char value that turns backslash handling off
inline constexpr char32_t kNoEscape = U'\0';

inline constexpr int kUnlimited = -1;

// ─────────────────────────────────────────────────────────────
// Split configuration. Character sets are UTF-8 strings; each
// code point in the string is a member.
//
// limit: -1 unlimited, 0 no words, N > 0 at most N words with the
// last one being the untouched remainder of the input.
// ─────────────────────────────────────────────────────────────
struct SplitOptions {
    std::string split_chars         = kDefaultSplitChars;
    char32_t    single_char         = kDefaultSingleChar;
    char32_t    double_char         = kDefaultDoubleChar;
    char32_t    escape_char         = kDefaultEscapeChar;
    std::string double_escape_chars = kDefaultDoubleEscapeChars;
    int         limit               = kUnlimited;

    bool escape_enabled() const { return escape_char != kNoEscape; }
};

inline SplitOptions default_options() {
    return SplitOptions{};
}

inline SplitOptions no_escape_options() {
    SplitOptions opts;
    opts.escape_char = kNoEscape;
    return opts;
}

// ─────────────────────────────────────────────────────────────
// Errors: what was still open when the input ran out
// ─────────────────────────────────────────────────────────────
enum class SplitError {
    UnterminatedSingleQuote,
    UnterminatedDoubleQuote,
    UnterminatedEscape,
};

inline const char* error_message(SplitError e) {
    switch (e) {
        case SplitError::UnterminatedSingleQuote: return "Unterminated single-quoted string";
        case SplitError::UnterminatedDoubleQuote: return "Unterminated double-quoted string";
        case SplitError::UnterminatedEscape:      return "Unterminated backslash-escape";
    }
    return "Unknown split error";
}

// Outcome of a split. words is empty whenever error is set.
struct SplitResult {
    std::vector<std::string> words;
    std::optional<SplitError> error;

    bool ok() const { return !error.has_value(); }
    explicit operator bool() const { return ok(); }

    static SplitResult failure(SplitError e) {
        SplitResult r;
        r.error = e;
        return r;
    }
};

} // namespace shwords

#endif // SHELLWORDS_OPTIONS_HPP
