//! # Parser Core
//!
//! Token navigation, error construction and the top-level statement loop.
//! The individual statements are parsed in parser_stmt.cpp.

#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

namespace cdl::parser {

auto describe(const ParseError& error) -> std::string {
    return "line " + std::to_string(error.line()) + ": " + error.message;
}

auto statement_keywords() -> const std::vector<std::string>& {
    static const std::vector<std::string> keywords = {
        "global", "cmd", "flag", "arg", "attr", "param", "name", "example", "topic", "text",
    };
    return keywords;
}

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        lexer::Token eof{};
        eof.kind = lexer::TokenKind::Eof;
        if (!tokens_.empty()) {
            eof.span = tokens_.back().span;
        }
        tokens_.push_back(eof);
    }
}

// ============================================================================
// Token Navigation
// ============================================================================

auto Parser::peek() const -> const lexer::Token& {
    return pos_ < tokens_.size() ? tokens_[pos_] : tokens_.back();
}

auto Parser::previous() const -> const lexer::Token& {
    return pos_ == 0 ? tokens_.front() : tokens_[pos_ - 1];
}

auto Parser::advance() -> const lexer::Token& {
    if (!is_at_end()) {
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

auto Parser::check(lexer::TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::check_same_line(lexer::TokenKind kind) const -> bool {
    return check(kind) && peek().line() == statement_line_;
}

auto Parser::match(lexer::TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(lexer::TokenKind kind, const std::string& message)
    -> Result<lexer::Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    if (check(lexer::TokenKind::Error)) {
        return lexical_error(peek());
    }
    return error_at(peek(), message + ", found " +
                                std::string(lexer::token_kind_to_string(peek().kind)));
}

auto Parser::error_at(const lexer::Token& token, std::string message, std::string code) const
    -> ParseError {
    return ParseError{
        .message = std::move(message), .span = token.span, .code = std::move(code), .notes = {}};
}

auto Parser::lexical_error(const lexer::Token& token) const -> ParseError {
    return error_at(token, token.error_message(), token.error_code());
}

// ============================================================================
// Entry Points
// ============================================================================

auto Parser::parse() -> Result<DeclTree, ParseError> {
    size_t statements = 0;

    while (!is_at_end()) {
        if (auto error = parse_statement()) {
            CDL_LOG_DEBUG("parser", "failed at statement " << statements + 1 << ": "
                                                           << describe(*error));
            return std::move(*error);
        }
        ++statements;
    }

    CDL_LOG_DEBUG("parser", "parsed " << statements << " statements, " << tree_.nodes.size()
                                      << " commands, " << tree_.topics.size() << " topics");
    return std::move(tree_);
}

auto parse_source(const lexer::Source& source) -> Result<DeclTree, ParseError> {
    lexer::Lexer lexer(source);
    Parser parser(lexer.tokenize());
    return parser.parse();
}

} // namespace cdl::parser
