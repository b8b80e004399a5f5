/*
 *  shellwords.cpp
 *  -----------------------------
 *  Split strings into words the way /bin/sh does, after quote
 *  removal and without any expansion.
 *
 *  Language: C++17 (POSIX / Linux)
 *  License: MIT License
 *
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#include "shellwords_cli.hpp"
#include "shellwords_options.hpp"
#include "shellwords_prompt.hpp"
#include "shellwords_rc.hpp"
#include "shellwords_split.hpp"

#ifdef SHELLWORDS_HAVE_READLINE
#  include <readline/readline.h>
#  include <readline/history.h>
#endif

// Version info for --version flag
#define SHELLWORDS_VERSION "1.0.0"

// -----------------------------------------------------------
//  Print version info
// -----------------------------------------------------------
void print_version() {
    std::cout << "shellwords version " << SHELLWORDS_VERSION << "\n";
#ifdef SHELLWORDS_HAVE_READLINE
    std::cout << "Built with C++17 for POSIX systems (readline enabled)\n";
#else
    std::cout << "Built with C++17 for POSIX systems\n";
#endif
    std::cout << "License: MIT\n";
}

// -----------------------------------------------------------
//  Print help info
// -----------------------------------------------------------
void print_help(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [OPTIONS] [STRING...]\n\n";
    std::cout << "Split each STRING (or each line of standard input) into words\n";
    std::cout << "following /bin/sh quoting rules, and print one word per line.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c STRING     Split STRING\n";
    std::cout << "  -n N          Return at most N words; the last is the raw remainder\n";
    std::cout << "  -s CHARS      Use CHARS as the word separators\n";
    std::cout << "  --no-escape   Treat backslashes as ordinary characters\n";
    std::cout << "  -0            Terminate each word with NUL instead of newline\n";
    std::cout << "  --version     Display version information\n";
    std::cout << "  --help, -h    Display this help message\n\n";
    std::cout << "Config File: $SHELLWORDS_RC or ~/.shellwordsrc\n";
    std::cout << "  split_chars, single_char, double_char, escape_char (or 'off'),\n";
    std::cout << "  double_escape_chars, limit, prompt\n";
}

// -----------------------------------------------------------
//  Helpers
// -----------------------------------------------------------

std::string main_prompt(int last_status, const std::string& rc_prompt) {
#ifdef SHELLWORDS_HAVE_READLINE
    return shwords::build_prompt_readline(last_status, rc_prompt);
#else
    return shwords::build_prompt_plain(last_status, rc_prompt);
#endif
}

// Read one line, showing prompt. False at EOF.
bool read_line(const std::string& prompt, std::string& line) {
#ifdef SHELLWORDS_HAVE_READLINE
    static bool rl_init = false;
    if (!rl_init) { using_history(); rl_init = true; }
    char* buf = readline(prompt.c_str());
    if (!buf) return false;
    line = buf;
    free(buf);
    if (!line.empty()) add_history(line.c_str());
    return true;
#else
    std::cout << prompt << std::flush;
    return static_cast<bool>(std::getline(std::cin, line));
#endif
}

// -----------------------------------------------------------
//  Interactive loop. ^D on a continuation line drops the open
//  input, not the session.
// -----------------------------------------------------------
int run_interactive(const shwords::SplitOptions& opts, const std::string& rc_prompt, bool nul_terminate) {
    shwords::LineJoiner joiner(opts);
    int last_status = shwords::kExitOk;
    int exit_status = shwords::kExitOk;
    std::vector<std::string> words;

    while (true) {
        const std::string prompt = joiner.pending() ? std::string(shwords::kContinuationPrompt)
                                                    : main_prompt(last_status, rc_prompt);
        std::string line;
        if (!read_line(prompt, line)) {
            if (!joiner.pending()) break;
            std::cout << "\n";
            if (auto e = joiner.drop()) {
                shwords::report_unterminated(*e);
                last_status = exit_status = shwords::kExitSplitError;
            }
            std::cin.clear();
            continue;
        }

        if (joiner.feed(line, words)) {
            shwords::print_words(std::cout, words, nul_terminate);
            last_status = shwords::kExitOk;
        }
    }

    std::cout << "\n";
    return exit_status;
}

// -----------------------------------------------------------
//  Entry point
// -----------------------------------------------------------

int main(int argc, char* argv[]) {
    shwords::RcSettings rc;
    shwords::load_rc(rc);

    shwords::CliOptions cli;
    cli.opts = rc.opts;

    const std::vector<std::string> args(argv + 1, argv + argc);
    if (int status = shwords::parse_args(args, cli); status != shwords::kExitOk)
        return status;

    switch (cli.action) {
        case shwords::CliAction::Version:
            print_version();
            return shwords::kExitOk;
        case shwords::CliAction::Help:
            print_help(argv[0]);
            return shwords::kExitOk;
        case shwords::CliAction::Split:
            break;
    }

    if (!cli.operands.empty())
        return shwords::split_operands(cli, std::cout);

    if (isatty(STDIN_FILENO))
        return run_interactive(cli.opts, rc.prompt, cli.nul_terminate);
    return shwords::split_lines(std::cin, std::cout, cli.opts, cli.nul_terminate);
}
