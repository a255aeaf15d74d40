//! # Lexer
//!
//! Converts declaration text into a token stream.
//!
//! ## Lexical Rules
//!
//! - Whitespace separates tokens; `#` starts a comment running to end of line
//! - Identifiers start with a letter, `_`, `/` or `.` and continue with
//!   letters, digits, `_`, `-`, `/`, `.`
//! - Numbers are runs of decimal digits
//! - `"text"` is a single-line string; `"""text"""` may span lines
//!
//! ## Error Handling
//!
//! Lexical faults never stop the lexer. Each fault yields an `Error` token
//! and is recorded in `errors()`, with a code:
//!
//! | Code   | Fault                        |
//! |--------|------------------------------|
//! | `L001` | unexpected character         |
//! | `L002` | unterminated string          |
//! | `L003` | unterminated multi-line string |
//!
//! ## Example
//!
//! ```cpp
//! auto source = Source::from_string("cmd remote add \"Add a remote\"");
//! Lexer lexer(source);
//! auto tokens = lexer.tokenize();
//! ```

#ifndef CDL_LEXER_LEXER_HPP
#define CDL_LEXER_LEXER_HPP

#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace cdl::lexer {

/// A lexical fault.
struct LexerError {
    std::string message;
    SourceSpan span;
    std::string code; ///< `L001`, `L002`, `L003`
};

/// Forward-only, restartable tokenizer over a borrowed `Source`.
class Lexer {
public:
    explicit Lexer(const Source& source);

    /// Returns the next token. Returns `Eof` repeatedly at the end of input.
    [[nodiscard]] auto next_token() -> Token;

    /// Lexes the remaining input; the last element is always `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    /// Rewinds to the start of the source and clears recorded errors.
    void reset();

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexerError> errors_;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;
    [[nodiscard]] auto make_string_token(std::string value, bool multiline) -> Token;
    [[nodiscard]] auto make_error_token(const std::string& message, const std::string& code)
        -> Token;

    // ========================================================================
    // Scanning
    // ========================================================================

    void skip_whitespace();
    void skip_line_comment();

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;

    /// Single-line `"..."`; implemented in lexer_string.cpp.
    [[nodiscard]] auto lex_string() -> Token;

    /// Multi-line `"""..."""`; implemented in lexer_string.cpp.
    [[nodiscard]] auto lex_multiline_string() -> Token;
};

/// True for characters that may start an identifier.
[[nodiscard]] auto is_ident_start(char c) -> bool;

/// True for characters that may continue an identifier.
[[nodiscard]] auto is_ident_continue(char c) -> bool;

/// Normalizes the body of a `"""` string: blank leading and trailing lines
/// are dropped, each line is left-trimmed, non-empty lines get a single
/// leading space, and lines are joined with '\n'.
[[nodiscard]] auto normalize_multiline(std::string_view raw) -> std::string;

} // namespace cdl::lexer

#endif // CDL_LEXER_LEXER_HPP
