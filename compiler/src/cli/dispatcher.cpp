//! # CLI Command Dispatcher
//!
//! Parses the `cdlc` command line and routes to a command handler.
//!
//! ## Architecture
//!
//! ```text
//! cdl_main()
//!   ├─ --help, -h       → print_usage()
//!   ├─ --version, -V    → print_version()
//!   ├─ lex <file>       → run_lex()
//!   ├─ parse <file>     → run_parse()
//!   ├─ check <file> <ns>→ run_check()
//!   ├─ run <file> ...   → run_run()
//!   └─ <file> <ns>      → run_compile()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                              |
//! |------|------------------------------------------------------|
//! | 0    | Success                                              |
//! | 1    | Unreadable file, compile error, invalid namespace    |
//! | 2    | Usage error, wrong extension, dispatch failure (run) |
//!
//! Logging options (`--log-level=`, `-v`, `-q`, ...) and `--no-color` are
//! accepted anywhere before a `--` separator and removed before routing.

#include "cli/driver.hpp"
#include "commands/cmd_debug.hpp"
#include "commands/cmd_run.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace cdl::cli {

namespace {

constexpr int EXIT_USAGE = 2;

int usage_error(const std::string& usage) {
    std::cerr << "Usage: " << usage << "\n";
    return EXIT_USAGE;
}

bool check_extension(const std::string& path) {
    if (has_source_extension(path)) {
        return true;
    }
    std::cerr << "error: source file must have the " << SOURCE_EXTENSION
              << " extension: " << path << "\n";
    return false;
}

} // namespace

int main_impl(int argc, char* argv[]) {
    // Options after "--" belong to the dispatched CLI of `cdlc run`.
    int option_end = argc;
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--") {
            option_end = i;
            break;
        }
    }

    log::Logger::init(log::parse_log_options(option_end, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (i < option_end) {
            if (log::is_log_option(arg)) {
                if (arg == "--verbose" || arg.starts_with("-v")) {
                    CompilerOptions::verbose = true;
                }
                continue;
            }
            if (arg == "--no-color") {
                CompilerOptions::color = false;
                continue;
            }
        }
        args.emplace_back(arg);
    }

    if (args.empty()) {
        print_usage();
        return 0;
    }

    const std::string& command = args[0];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    CDL_LOG_DEBUG("cli", "command: " << command);

    if (command == "lex" || command == "parse") {
        if (args.size() != 2) {
            return usage_error("cdlc " + command + " <file.cdl>");
        }
        if (!check_extension(args[1])) {
            return EXIT_USAGE;
        }
        return command == "lex" ? run_lex(args[1]) : run_parse(args[1]);
    }

    if (command == "check") {
        if (args.size() != 3) {
            return usage_error("cdlc check <file.cdl> <namespace>");
        }
        if (!check_extension(args[1])) {
            return EXIT_USAGE;
        }
        return run_check(args[1], args[2]);
    }

    if (command == "run") {
        if (args.size() < 2) {
            return usage_error("cdlc run <file.cdl> [--] <args...>");
        }
        if (!check_extension(args[1])) {
            return EXIT_USAGE;
        }
        std::vector<std::string> rest(args.begin() + 2, args.end());
        if (!rest.empty() && rest.front() == "--") {
            rest.erase(rest.begin());
        }
        return run_run(args[1], rest);
    }

    if (args.size() != 2) {
        return usage_error("cdlc <file.cdl> <namespace>");
    }
    if (!check_extension(args[0])) {
        return EXIT_USAGE;
    }
    return run_compile(args[0], args[1]);
}

} // namespace cdl::cli

int cdl_main(int argc, char* argv[]) {
    int code = cdl::cli::main_impl(argc, argv);
    cdl::log::Logger::instance().flush();
    return code;
}
