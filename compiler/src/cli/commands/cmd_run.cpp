//! # Run Command
//!
//! ```bash
//! $ cdlc run git.cdl -- rem add origin --force
//! command: remote/add
//!   --force = true
//!   name = "origin"
//!   --help = false (global)
//! ```
//!
//! Exit codes: 0 on success or help, 1 when compilation fails, 2 when the
//! arguments do not dispatch.

#include "cmd_run.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "cmd_debug.hpp"
#include "dispatch/engine.hpp"
#include "log/log.hpp"

#include <iostream>
#include <memory>

namespace cdl::cli {

namespace {

void print_value(const dispatch::FlagValue& value, std::ostream& out) {
    if (const auto* b = std::get_if<bool>(&value)) {
        out << (*b ? "true" : "false");
    } else {
        out << "\"" << std::get<std::string>(value) << "\"";
    }
}

/// Handler bound to every leaf by `cdlc run`.
class PrintInvocation : public dispatch::CommandHandler {
public:
    explicit PrintInvocation(std::ostream& out) : out_(out) {}

    auto execute(const dispatch::Invocation& invocation) -> Result<int, std::string> override {
        print_invocation(invocation, out_);
        return 0;
    }

private:
    std::ostream& out_;
};

} // namespace

void print_invocation(const dispatch::Invocation& invocation, std::ostream& out) {
    out << "command: " << invocation.path << "\n";
    for (const auto& [name, value] : invocation.params.flags()) {
        out << "  --" << name << " = ";
        print_value(value, out);
        out << "\n";
    }
    for (const auto& [name, value] : invocation.params.args()) {
        out << "  " << name << " = \"" << value << "\"\n";
    }
    for (const auto& [name, value] : invocation.globals.flags()) {
        out << "  --" << name << " = ";
        print_value(value, out);
        out << " (global)\n";
    }
}

int run_run(const std::string& path, const std::vector<std::string>& args) {
    auto& diag = get_diagnostic_emitter();

    std::string content;
    try {
        content = read_file(path);
    } catch (const std::exception& e) {
        CDL_LOG_ERROR("cli", e.what());
        diag.error(ErrorCodes::FILE_NOT_FOUND, e.what());
        return 1;
    }
    diag.set_source_content(path, content);
    auto source = lexer::Source::from_string(std::move(content), path);

    auto tree = compile_source(source, diag);
    if (!tree) {
        return 1;
    }

    dispatch::Engine engine(std::move(*tree), std::cout);
    engine.set_color_enabled(CompilerOptions::color && terminal_supports_colors());
    for (auto leaf : engine.tree().leaves()) {
        engine.register_handler(engine.tree().path(leaf),
                                std::make_unique<PrintInvocation>(std::cout));
    }

    auto result = engine.run(args);
    if (is_err(result)) {
        std::cerr << "error: " << unwrap_err(result) << "\n";
        return 2;
    }
    return unwrap(result);
}

} // namespace cdl::cli
