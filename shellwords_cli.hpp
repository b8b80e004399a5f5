#ifndef SHELLWORDS_CLI_HPP
#define SHELLWORDS_CLI_HPP

#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "shellwords_diag.hpp"
#include "shellwords_options.hpp"
#include "shellwords_rc.hpp"
#include "shellwords_split.hpp"

namespace shwords {

// Exit statuses
inline constexpr int kExitOk = 0;
inline constexpr int kExitSplitError = 1;
inline constexpr int kExitUsage = 2;

enum class CliAction { Split, Help, Version };

// ─────────────────────────────────────────────────────────────
// Parsed command line, starting from the rc settings
// ─────────────────────────────────────────────────────────────
struct CliOptions {
    SplitOptions opts;
    bool nul_terminate = false;
    std::vector<std::string> operands;
    CliAction action = CliAction::Split;
};

// ─────────────────────────────────────────────────────────────
// Parse arguments (without the program name) into cli.
// Returns kExitOk, or kExitUsage after reporting to diag.
// ─────────────────────────────────────────────────────────────
inline int parse_args(const std::vector<std::string>& args, CliOptions& cli,
                      std::ostream& diag = std::cerr) {
    bool options_done = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            cli.operands.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "--version") {
            cli.action = CliAction::Version;
            return kExitOk;
        } else if (arg == "--help" || arg == "-h") {
            cli.action = CliAction::Help;
            return kExitOk;
        } else if (arg == "--no-escape") {
            cli.opts.escape_char = kNoEscape;
        } else if (arg == "-0") {
            cli.nul_terminate = true;
        } else if (arg == "-c" || arg == "-n" || arg == "-s") {
            if (i + 1 >= args.size()) {
                log_error(arg + " requires an argument", diag);
                return kExitUsage;
            }
            const std::string& val = args[++i];
            if (arg == "-c") {
                cli.operands.push_back(val);
            } else if (arg == "-s") {
                cli.opts.split_chars = val;
            } else if (!parse_limit(val, cli.opts.limit)) {
                log_error("-n: expected an integer >= -1, got '" + val + "'", diag);
                return kExitUsage;
            }
        } else {
            log_error("unknown option: " + arg, diag);
            diag << "Try 'shellwords --help' for more information.\n";
            return kExitUsage;
        }
    }
    return kExitOk;
}

inline void print_words(std::ostream& out, const std::vector<std::string>& words, bool nul_terminate) {
    for (const auto& w : words) {
        out << w;
        if (nul_terminate) out << '\0';
        else out << '\n';
    }
    out << std::flush;
}

// Split every operand; a failing one does not stop the rest.
inline int split_operands(const CliOptions& cli, std::ostream& out, std::ostream& diag = std::cerr) {
    int status = kExitOk;
    for (const auto& s : cli.operands) {
        SplitResult r = split_with_options(s, cli.opts);
        if (!r) {
            log_error(error_message(*r.error), diag);
            status = kExitSplitError;
            continue;
        }
        print_words(out, r.words, cli.nul_terminate);
    }
    return status;
}

// ─────────────────────────────────────────────────────────────
// Joins input lines while a quote or a trailing backslash is
// still open, the way sh asks for more with its PS2 prompt.
// ─────────────────────────────────────────────────────────────
class LineJoiner {
public:
    explicit LineJoiner(SplitOptions opts) : opts_(std::move(opts)) {}

    // True once the input so far splits; words then holds the result.
    bool feed(const std::string& line, std::vector<std::string>& words) {
        std::string input = have_pending_ ? pending_ + "\n" + line : line;
        SplitResult r = split_with_options(input, opts_);
        if (!r) {
            pending_ = std::move(input);
            have_pending_ = true;
            return false;
        }
        pending_.clear();
        have_pending_ = false;
        words = std::move(r.words);
        return true;
    }

    bool pending() const { return have_pending_; }

    // Forget the open input, returning what was left unterminated.
    std::optional<SplitError> drop() {
        if (!have_pending_) return std::nullopt;
        SplitResult r = split_with_options(pending_, opts_);
        pending_.clear();
        have_pending_ = false;
        return r.error;
    }

private:
    SplitOptions opts_;
    std::string pending_;
    bool have_pending_ = false;
};

inline void report_unterminated(SplitError e, std::ostream& diag = std::cerr) {
    log_error(std::string(error_message(e)) + " at end of input", diag);
}

// ─────────────────────────────────────────────────────────────
// Non-interactive line loop: split each (joined) line of in.
// ─────────────────────────────────────────────────────────────
inline int split_lines(std::istream& in, std::ostream& out, const SplitOptions& opts,
                       bool nul_terminate, std::ostream& diag = std::cerr) {
    LineJoiner joiner(opts);
    std::string line;
    std::vector<std::string> words;

    while (std::getline(in, line)) {
        if (joiner.feed(line, words)) print_words(out, words, nul_terminate);
    }

    if (auto e = joiner.drop()) {
        report_unterminated(*e, diag);
        return kExitSplitError;
    }
    return kExitOk;
}

} // namespace shwords

#endif // SHELLWORDS_CLI_HPP
