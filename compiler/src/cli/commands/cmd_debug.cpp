//! # Compile Commands
//!
//! This file implements `cdlc <file> <ns>` and the `lex`, `parse` and
//! `check` commands that stop after a given stage.
//!
//! ## Usage
//!
//! ```bash
//! cdlc git.cdl gitcli         # Validate, exit 0 on success
//! cdlc lex git.cdl            # Show tokens
//! cdlc parse git.cdl          # Show declaration tree
//! cdlc check git.cdl gitcli   # Show emit plan
//! ```
//!
//! Every failure is reported through the diagnostic emitter and yields
//! exit code 1.

#include "cmd_debug.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"
#include "sema/emit_plan.hpp"

#include <iostream>

namespace cdl::cli {

/// Reads `path` into a `Source`, registering its text with the emitter.
static std::optional<lexer::Source> load_source(const std::string& path, DiagnosticEmitter& diag) {
    std::string content;
    try {
        content = read_file(path);
    } catch (const std::exception& e) {
        CDL_LOG_ERROR("cli", e.what());
        diag.error(ErrorCodes::FILE_NOT_FOUND, e.what());
        return std::nullopt;
    }

    diag.set_source_content(path, content);
    return lexer::Source::from_string(std::move(content), path);
}

static bool check_namespace(const std::string& ns, DiagnosticEmitter& diag) {
    if (sema::is_valid_identifier(ns)) {
        return true;
    }
    diag.error(ErrorCodes::INVALID_NAMESPACE, "invalid namespace '" + ns + "'");
    return false;
}

std::optional<sema::ResolvedTree> compile_source(const lexer::Source& source,
                                                 DiagnosticEmitter& diag) {
    auto parsed = parser::parse_source(source);
    if (is_err(parsed)) {
        const auto& error = unwrap_err(parsed);
        CDL_LOG_DEBUG("cli", parser::describe(error));
        diag.error(error.code, error.message, error.span, error.notes);
        return std::nullopt;
    }

    auto resolved = sema::resolve(std::move(unwrap(parsed)));
    if (is_err(resolved)) {
        const auto& error = unwrap_err(resolved);
        CDL_LOG_DEBUG("cli", sema::describe(error));
        diag.error(error.code, error.message, error.span, error.notes);
        return std::nullopt;
    }

    return std::move(unwrap(resolved));
}

int run_compile(const std::string& path, const std::string& ns) {
    auto& diag = get_diagnostic_emitter();

    auto source = load_source(path, diag);
    if (!source) {
        return 1;
    }

    auto tree = compile_source(*source, diag);
    if (!tree) {
        return 1;
    }

    if (!check_namespace(ns, diag)) {
        return 1;
    }

    CDL_LOG_INFO("cli", "compiled " << path << " (" << tree->leaves().size()
                                    << " commands) for namespace " << ns);
    return 0;
}

int run_lex(const std::string& path) {
    auto& diag = get_diagnostic_emitter();

    auto source = load_source(path, diag);
    if (!source) {
        return 1;
    }

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize();

    for (const auto& token : tokens) {
        std::cout << token.span.start.line << ":" << token.span.start.column << " "
                  << lexer::token_kind_to_string(token.kind);
        if (token.is(lexer::TokenKind::StringLiteral)) {
            std::cout << (token.string_value().empty() ? "" : " ") << token.string_value();
        } else if (token.is_one_of({lexer::TokenKind::Identifier, lexer::TokenKind::IntLiteral})) {
            std::cout << " " << token.lexeme;
        } else if (token.is_error()) {
            std::cout << " " << token.error_message();
        }
        std::cout << "\n";
    }

    if (lex.has_errors()) {
        for (const auto& error : lex.errors()) {
            diag.error(error.code, error.message, error.span);
        }
        return 1;
    }

    CDL_LOG_INFO("lexer", "lexed " << tokens.size() << " tokens from " << path);
    return 0;
}

int run_parse(const std::string& path) {
    auto& diag = get_diagnostic_emitter();

    auto source = load_source(path, diag);
    if (!source) {
        return 1;
    }

    auto parsed = parser::parse_source(*source);
    if (is_err(parsed)) {
        const auto& error = unwrap_err(parsed);
        diag.error(error.code, error.message, error.span, error.notes);
        return 1;
    }

    const auto& tree = unwrap(parsed);
    parser::dump_tree(tree, std::cout);
    CDL_LOG_INFO("parser", "parsed " << tree.nodes.size() << " commands and "
                                     << tree.topics.size() << " topics from " << path);
    return 0;
}

int run_check(const std::string& path, const std::string& ns) {
    auto& diag = get_diagnostic_emitter();

    auto source = load_source(path, diag);
    if (!source) {
        return 1;
    }

    auto tree = compile_source(*source, diag);
    if (!tree || !check_namespace(ns, diag)) {
        return 1;
    }

    std::cout << "namespace: " << ns << "\n";
    sema::print_emit_plan(sema::build_emit_plan(*tree), std::cout);
    return 0;
}

} // namespace cdl::cli
