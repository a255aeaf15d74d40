#include "utils.hpp"

#include "common.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace cdl::cli {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("cannot read file: " + path);
    }
    return buffer.str();
}

bool has_source_extension(const std::string& path) {
    return path.size() > SOURCE_EXTENSION.size() && path.ends_with(SOURCE_EXTENSION);
}

void print_usage() {
    std::cout << "CDL Compiler " << VERSION << "\n\n";
    std::cout << "Usage: cdlc <file.cdl> <namespace>\n";
    std::cout << "       cdlc <command> [options] <file.cdl> [...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  lex <file>              Print the token stream\n";
    std::cout << "  parse <file>            Print the declaration tree\n";
    std::cout << "  check <file> <ns>       Compile and print the emit plan\n";
    std::cout << "  run <file> [--] <args>  Dispatch arguments against the declared CLI\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h              Show this help\n";
    std::cout << "  --version, -V           Show version\n";
    std::cout << "  --no-color              Disable colored output\n";
    std::cout << "  --verbose, -v[v[v]]     Increase log verbosity\n";
    std::cout << "  -q, --quiet             Only log errors\n";
    std::cout << "  --log-level=<level>     trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=<spec>     Per-module levels, e.g. parser=debug,*=warn\n";
    std::cout << "  --log-file=<path>       Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>      text or json\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  CDL_LOG                 Log level or filter spec when no option is given\n";
}

void print_version() {
    std::cout << "cdlc " << VERSION << "\n";
}

} // namespace cdl::cli
