#ifndef SHELLWORDS_SPLIT_HPP
#define SHELLWORDS_SPLIT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shellwords_options.hpp"
#include "shellwords_utf8.hpp"

namespace shwords {

// One word taken off the front of the input.
struct WordResult {
    std::string word;
    std::string_view remainder;
    std::optional<SplitError> error;
};

namespace detail {

enum class State { Raw, Single, Double, Escape };

inline WordResult word_error(SplitError e) {
    WordResult w;
    w.error = e;
    return w;
}

} // namespace detail

// ───────────────────────────────────────────────────────────────────────
// Word parser: consume one word from the front of input.
//
// Starts in Raw. Single, Double and Escape always fall back to Raw; only
// Raw ends a word, either on a split character (which is consumed) or at
// end of input. `buf` is scratch storage for the word being built.
// ───────────────────────────────────────────────────────────────────────
inline WordResult parse_word(std::string_view input,
                             const SplitOptions& opts,
                             std::string_view split_chars,
                             std::string& buf)
{
    using detail::State;

    buf.clear();
    const bool escapes = opts.escape_enabled();
    State st = State::Raw;

    while (true) {
        switch (st) {
            case State::Raw: {
                size_t pos = 0;
                while (pos < input.size() && st == State::Raw) {
                    const Rune r = decode_rune(input.substr(pos));
                    const size_t next = pos + r.length;

                    // Quote and escape characters win over split characters.
                    if (r.value == opts.single_char) {
                        st = State::Single;
                    } else if (r.value == opts.double_char) {
                        st = State::Double;
                    } else if (escapes && r.value == opts.escape_char) {
                        st = State::Escape;
                    } else if (contains_rune(split_chars, r.value)) {
                        buf.append(input.substr(0, pos));
                        return {buf, input.substr(next), std::nullopt};
                    } else {
                        pos = next;
                        continue;
                    }

                    buf.append(input.substr(0, pos));
                    input.remove_prefix(next);
                }
                if (st == State::Raw) {
                    buf.append(input);
                    return {buf, std::string_view{}, std::nullopt};
                }
                break;
            }

            case State::Escape: {
                if (input.empty()) return detail::word_error(SplitError::UnterminatedEscape);
                const Rune r = decode_rune(input);
                // backslash-newline is a line continuation and leaves nothing behind
                if (r.value != U'\n') buf.append(input.substr(0, r.length));
                input.remove_prefix(r.length);
                st = State::Raw;
                break;
            }

            case State::Single: {
                size_t pos = 0;
                bool closed = false;
                while (pos < input.size()) {
                    const Rune r = decode_rune(input.substr(pos));
                    if (r.value == opts.single_char) {
                        buf.append(input.substr(0, pos));
                        input.remove_prefix(pos + r.length);
                        closed = true;
                        break;
                    }
                    pos += r.length;
                }
                if (!closed) return detail::word_error(SplitError::UnterminatedSingleQuote);
                st = State::Raw;
                break;
            }

            case State::Double: {
                size_t pos = 0;
                while (pos < input.size() && st == State::Double) {
                    const Rune r = decode_rune(input.substr(pos));
                    size_t next = pos + r.length;

                    if (r.value == opts.double_char) {
                        buf.append(input.substr(0, pos));
                        input.remove_prefix(next);
                        st = State::Raw;
                    } else if (escapes && r.value == opts.escape_char) {
                        // Only a few characters are escapable inside double quotes.
                        const Rune r2 = decode_rune(input.substr(next));
                        if (r2.length > 0 && contains_rune(opts.double_escape_chars, r2.value)) {
                            buf.append(input.substr(0, pos));
                            if (r2.value != U'\n') buf.append(input.substr(next, r2.length));
                            input.remove_prefix(next + r2.length);
                            pos = 0;
                        } else {
                            // Backslash and follower stay in the literal run.
                            pos = next + r2.length;
                        }
                    } else {
                        pos = next;
                    }
                }
                if (st == State::Double) return detail::word_error(SplitError::UnterminatedDoubleQuote);
                break;
            }
        }
    }
}

// ───────────────────────────────────────────────────────────────────────
// Driver: split input into words the way /bin/sh does after quote
// removal. No expansion of any kind is performed.
// ───────────────────────────────────────────────────────────────────────
inline SplitResult split_with_options(std::string_view input, const SplitOptions& opts) {
    const std::string_view split_chars =
        opts.split_chars.empty() ? std::string_view(kDefaultSplitChars)
                                 : std::string_view(opts.split_chars);

    SplitResult result;

    if (opts.limit == 0) return result;

    if (opts.limit == 1) {
        // The whole input is the single word, quotes and all.
        const std::string_view only = trim_runes(input, split_chars);
        if (!only.empty()) result.words.emplace_back(only);
        return result;
    }

    std::string scratch;

    while (!input.empty()) {
        const Rune r = decode_rune(input);
        if (contains_rune(split_chars, r.value)) {
            input.remove_prefix(r.length);
            continue;
        }
        if (opts.escape_enabled() && r.value == opts.escape_char) {
            const std::string_view next = input.substr(r.length);
            if (next.empty()) return SplitResult::failure(SplitError::UnterminatedEscape);
            const Rune r2 = decode_rune(next);
            if (r2.value == U'\n') {
                input = next.substr(r2.length);
                continue;
            }
        }

        WordResult w = parse_word(input, opts, split_chars, scratch);
        if (w.error) return SplitResult::failure(*w.error);
        result.words.push_back(std::move(w.word));
        input = w.remainder;

        if (opts.limit == static_cast<int>(result.words.size()) + 1) {
            const std::string_view tail = trim_ascii_space(input);
            if (!tail.empty()) result.words.emplace_back(tail);
            return result;
        }
    }

    return result;
}

// A null options pointer means the defaults.
inline SplitResult split_with_options(std::string_view input, const SplitOptions* opts) {
    if (!opts) return split_with_options(input, default_options());
    return split_with_options(input, *opts);
}

inline SplitResult split(std::string_view input) {
    return split_with_options(input, default_options());
}

inline SplitResult split_n(std::string_view input, int n) {
    SplitOptions opts;
    opts.limit = n;
    return split_with_options(input, opts);
}

} // namespace shwords

#endif // SHELLWORDS_SPLIT_HPP
