//! # Parser
//!
//! Single-pass statement parser for CDL declaration files.
//!
//! ## Statements
//!
//! | Statement                          | Attaches to                        |
//! |------------------------------------|------------------------------------|
//! | `global`                           | clears the current command/topic   |
//! | `cmd seg [seg...] ["desc"]`        | selects (creates) a command        |
//! | `flag name type "desc" [short]`    | current command, else global       |
//! | `arg name type "desc"`             | current command (required)         |
//! | `attr name = value` (or `param`)   | current command, else global       |
//! | `name "app" "tagline"`             | global only, once                  |
//! | `example "text"`                   | current command (required)         |
//! | `topic name "desc"`                | selects (creates) a topic          |
//! | `text "body"`                      | current topic (required)           |
//!
//! The optional trailing identifiers of a statement (extra `cmd` path
//! segments, the `flag` short alias) are only taken from the statement's own
//! line, so a missing alias never consumes the next statement's keyword.
//!
//! Parsing stops at the first error; there is no recovery.

#ifndef CDL_PARSER_PARSER_HPP
#define CDL_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cdl::parser {

/// A syntax or statement-context error.
struct ParseError {
    std::string message;
    SourceSpan span;
    std::string code; ///< `L00x` for lexical faults, `P001`/`P002` otherwise.
    std::vector<std::string> notes;

    [[nodiscard]] auto line() const -> uint32_t {
        return span.start.line;
    }
};

/// "line N: message"
[[nodiscard]] auto describe(const ParseError& error) -> std::string;

/// Statement keywords, in the order they are listed in help and suggestions.
[[nodiscard]] auto statement_keywords() -> const std::vector<std::string>&;

class Parser {
public:
    explicit Parser(std::vector<lexer::Token> tokens);

    /// Parses the whole token stream into a declaration tree.
    [[nodiscard]] auto parse() -> Result<DeclTree, ParseError>;

private:
    using Status = std::optional<ParseError>;

    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;

    DeclTree tree_;
    std::optional<NodeId> current_command_;
    std::optional<TopicId> current_topic_;
    uint32_t statement_line_ = 0; ///< Line of the keyword being parsed.

    // ========================================================================
    // Token Navigation
    // ========================================================================

    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;

    /// `check()` restricted to the current statement's line.
    [[nodiscard]] auto check_same_line(lexer::TokenKind kind) const -> bool;

    auto match(lexer::TokenKind kind) -> bool;

    /// Consumes a token of `kind` or reports `message`.
    ///
    /// An `Error` token in the way is reported as the lexical error it is.
    [[nodiscard]] auto expect(lexer::TokenKind kind, const std::string& message)
        -> Result<lexer::Token, ParseError>;

    [[nodiscard]] auto error_at(const lexer::Token& token, std::string message,
                                std::string code = "P001") const -> ParseError;

    [[nodiscard]] auto lexical_error(const lexer::Token& token) const -> ParseError;

    // ========================================================================
    // Statements (parser_stmt.cpp)
    // ========================================================================

    [[nodiscard]] auto parse_statement() -> Status;
    [[nodiscard]] auto parse_global() -> Status;
    [[nodiscard]] auto parse_cmd() -> Status;
    [[nodiscard]] auto parse_flag() -> Status;
    [[nodiscard]] auto parse_arg() -> Status;
    [[nodiscard]] auto parse_attr() -> Status;
    [[nodiscard]] auto parse_name() -> Status;
    [[nodiscard]] auto parse_example() -> Status;
    [[nodiscard]] auto parse_topic() -> Status;
    [[nodiscard]] auto parse_text() -> Status;

    [[nodiscard]] auto parse_attr_value() -> Result<AttrValue, ParseError>;
};

/// Lexes and parses `source` in one step.
[[nodiscard]] auto parse_source(const lexer::Source& source) -> Result<DeclTree, ParseError>;

} // namespace cdl::parser

#endif // CDL_PARSER_PARSER_HPP
