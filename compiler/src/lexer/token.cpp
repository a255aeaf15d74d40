//! # Token Utilities
//!
//! - `token_kind_to_string()`: display names used in parser messages
//! - `string_value()`, `error_message()` and `error_code()`: payload accessors

#include "lexer/token.hpp"

namespace cdl::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of input";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::StringLiteral:
        return "string";
    case TokenKind::IntLiteral:
        return "number";
    case TokenKind::Equals:
        return "'='";
    case TokenKind::Error:
        return "error";
    }
    return "unknown";
}

auto Token::string_value() const -> const std::string& {
    return std::get<StringValue>(value).value;
}

auto Token::error_message() const -> const std::string& {
    return std::get<ErrorValue>(value).message;
}

auto Token::error_code() const -> const std::string& {
    return std::get<ErrorValue>(value).code;
}

} // namespace cdl::lexer
