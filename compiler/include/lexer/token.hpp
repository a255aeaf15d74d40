//! # Token Definitions
//!
//! Tokens produced by the CDL lexer.
//!
//! | Kind            | Example                      |
//! |-----------------|------------------------------|
//! | `Identifier`    | `cmd`, `remote-add`, `true`  |
//! | `StringLiteral` | `"desc"`, `"""multi"""`      |
//! | `IntLiteral`    | `42`                         |
//! | `Equals`        | `=`                          |
//! | `Error`         | an unterminated string       |
//! | `Eof`           | end of input                 |
//!
//! Statement keywords (`cmd`, `flag`, ...) and the literals `true`/`false`
//! are plain identifiers; the parser interprets them by position.

#ifndef CDL_LEXER_TOKEN_HPP
#define CDL_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>

namespace cdl::lexer {

enum class TokenKind : uint8_t {
    Eof,           ///< End of input
    Identifier,    ///< Bare word
    StringLiteral, ///< Quoted text, single or triple quoted
    IntLiteral,    ///< Decimal digits
    Equals,        ///< `=`
    Error,         ///< Lexical fault; see `error_message()`
};

/// Display name of a token kind ("identifier", "string", ...).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Content of a string literal.
struct StringValue {
    std::string value; ///< Text between the quotes, multi-line text normalized.
    bool multiline;    ///< Written with `"""`.
};

/// Message attached to an `Error` token.
struct ErrorValue {
    std::string message;
    std::string code; ///< Diagnostic code, see lexer.hpp
};

/// A lexical token.
///
/// `lexeme` views the source text; it is valid while the `Source` lives.
struct Token {
    TokenKind kind;
    SourceSpan span;
    std::string_view lexeme;
    std::variant<std::monostate, StringValue, ErrorValue> value;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    [[nodiscard]] auto is_error() const -> bool {
        return kind == TokenKind::Error;
    }

    /// 1-based line on which the token starts.
    [[nodiscard]] auto line() const -> uint32_t {
        return span.start.line;
    }

    /// Content of a `StringLiteral`. Throws `std::bad_variant_access` otherwise.
    [[nodiscard]] auto string_value() const -> const std::string&;

    /// Message of an `Error` token. Throws `std::bad_variant_access` otherwise.
    [[nodiscard]] auto error_message() const -> const std::string&;

    /// Diagnostic code of an `Error` token.
    [[nodiscard]] auto error_code() const -> const std::string&;
};

} // namespace cdl::lexer

#endif // CDL_LEXER_TOKEN_HPP
