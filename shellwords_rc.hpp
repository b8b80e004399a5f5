#ifndef SHELLWORDS_RC_HPP
#define SHELLWORDS_RC_HPP

#include <string>
#include <string_view>
#include <vector>
#include <fstream>
#include <istream>
#include <ostream>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <unistd.h>
#include <sys/types.h>
#include <pwd.h>

#include "shellwords_diag.hpp"
#include "shellwords_options.hpp"
#include "shellwords_split.hpp"
#include "shellwords_utf8.hpp"

namespace shwords {

// -------------------------------------------------------------------------------------------------
// Settings read from ~/.shellwordsrc (command-line flags are applied on top by main.cpp).
// -------------------------------------------------------------------------------------------------
struct RcSettings {
    SplitOptions opts;
    std::string prompt;
};

// -------------------------------------------------------------------------------------------------
// Small helpers
// -------------------------------------------------------------------------------------------------
inline std::string home_dir() {
    if (const char* h = std::getenv("HOME")) return h;
    if (passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir) return pw->pw_dir;
    }
    return "/";
}

inline std::string rc_path() {
    if (const char* p = std::getenv("SHELLWORDS_RC"); p && *p) return p;
    return home_dir() + "/.shellwordsrc";
}

// Exactly one code point.
inline bool parse_rune_value(std::string_view v, char32_t& out) {
    if (v.empty()) return false;
    Rune r = decode_rune(v);
    if (r.length != v.size()) return false;
    out = r.value;
    return true;
}

inline bool parse_limit(const std::string& v, int& out) {
    if (v.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || n < -1 || n > INT_MAX) return false;
    out = static_cast<int>(n);
    return true;
}

// -------------------------------------------------------------------------------------------------
// Apply one rc line. Returns false with err set when the line is rejected; settings are left
// untouched in that case. Values go through the splitter, so they may be quoted.
// -------------------------------------------------------------------------------------------------
inline bool apply_rc_line(RcSettings& rc, std::string_view line, std::string& err) {
    std::string_view body = trim_ascii_space(line);
    if (body.empty() || body.front() == '#') return true;

    SplitResult parsed = split(body);
    if (!parsed) {
        err = error_message(*parsed.error);
        return false;
    }

    const std::vector<std::string>& w = parsed.words;
    if (w.empty()) return true;
    const std::string& key = w[0];
    if (w.size() != 2) {
        err = key + ": expected exactly one value";
        return false;
    }
    const std::string& val = w[1];

    if (key == "split_chars") {
        rc.opts.split_chars = val;
        return true;
    }

    if (key == "double_escape_chars") {
        rc.opts.double_escape_chars = val;
        return true;
    }

    if (key == "single_char" || key == "double_char") {
        char32_t c;
        if (!parse_rune_value(val, c)) {
            err = key + ": value must be a single character";
            return false;
        }
        (key == "single_char" ? rc.opts.single_char : rc.opts.double_char) = c;
        return true;
    }

    if (key == "escape_char") {
        if (val == "off" || val == "none") {
            rc.opts.escape_char = kNoEscape;
            return true;
        }
        char32_t c;
        if (!parse_rune_value(val, c)) {
            err = "escape_char: value must be a single character or 'off'";
            return false;
        }
        rc.opts.escape_char = c;
        return true;
    }

    if (key == "limit") {
        int n;
        if (!parse_limit(val, n)) {
            err = "limit: expected an integer >= -1";
            return false;
        }
        rc.opts.limit = n;
        return true;
    }

    if (key == "prompt") {
        rc.prompt = val;
        return true;
    }

    err = "unknown setting '" + key + "'";
    return false;
}

// -------------------------------------------------------------------------------------------------
// Read rc lines from a stream, warning about (and skipping) bad ones.
// -------------------------------------------------------------------------------------------------
inline void load_rc_stream(RcSettings& rc, std::istream& in, const std::string& name,
                           std::ostream& diag = std::cerr) {
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::string err;
        if (!apply_rc_line(rc, line, err))
            log_warn(name + ":" + std::to_string(lineno) + ": " + err, diag);
    }
}

// -------------------------------------------------------------------------------------------------
// Load $SHELLWORDS_RC or ~/.shellwordsrc. A missing file is fine.
// -------------------------------------------------------------------------------------------------
inline void load_rc(RcSettings& rc) {
    const std::string path = rc_path();
    std::ifstream in(path);
    if (!in) return;
    load_rc_stream(rc, in, path);
}

}
#endif // SHELLWORDS_RC_HPP
