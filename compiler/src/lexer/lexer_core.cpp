//! # Lexer Core
//!
//! Character access, token construction, whitespace and comment skipping,
//! identifiers, numbers and the `next_token()` dispatch. String literals are
//! in lexer_string.cpp.

#include "lexer/lexer.hpp"
#include "log/log.hpp"

#include <cctype>

namespace cdl::lexer {

auto is_ident_start(char c) -> bool {
    auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || c == '/' || c == '.';
}

auto is_ident_continue(char c) -> bool {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '-' || c == '/' || c == '.';
}

Lexer::Lexer(const Source& source) : source_(source) {}

void Lexer::reset() {
    pos_ = 0;
    token_start_ = 0;
    errors_.clear();
}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_ > token_start_ ? pos_ - 1 : token_start_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);
    end_loc.length = start_loc.length;

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = source_.slice(token_start_, pos_),
                 .value = std::monostate{}};
}

auto Lexer::make_string_token(std::string value, bool multiline) -> Token {
    auto token = make_token(TokenKind::StringLiteral);
    token.value = StringValue{.value = std::move(value), .multiline = multiline};
    return token;
}

auto Lexer::make_error_token(const std::string& message, const std::string& code) -> Token {
    auto token = make_token(TokenKind::Error);
    token.value = ErrorValue{.message = message, .code = code};
    errors_.push_back(LexerError{.message = message, .span = token.span, .code = code});

    CDL_LOG_DEBUG("lexer", source_.filename() << ":" << token.line() << ": " << message);
    return token;
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        if (c == '#') {
            skip_line_comment();
        } else if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
            advance();
        } else {
            return;
        }
    }
}

void Lexer::skip_line_comment() {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
}

auto Lexer::lex_identifier() -> Token {
    while (is_ident_continue(peek())) {
        advance();
    }
    return make_token(TokenKind::Identifier);
}

auto Lexer::lex_number() -> Token {
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }
    return make_token(TokenKind::IntLiteral);
}

auto Lexer::next_token() -> Token {
    skip_whitespace();
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (is_ident_start(c)) {
        return lex_identifier();
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
        return lex_number();
    }
    if (c == '"') {
        if (peek_next() == '"' && peek_n(2) == '"') {
            return lex_multiline_string();
        }
        return lex_string();
    }
    if (c == '=') {
        advance();
        return make_token(TokenKind::Equals);
    }

    advance();
    return make_error_token("unexpected character '" + std::string(1, c) + "'", "L001");
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().is_eof()) {
            break;
        }
    }
    CDL_LOG_TRACE("lexer", source_.filename() << ": " << tokens.size() << " tokens, "
                                              << errors_.size() << " errors");
    return tokens;
}

} // namespace cdl::lexer
