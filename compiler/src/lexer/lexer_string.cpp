//! # String Literals
//!
//! | Form          | Content                                   |
//! |---------------|-------------------------------------------|
//! | `"text"`      | Verbatim, must close on the same line     |
//! | `"""text"""`  | May span lines, normalized on completion  |
//!
//! No escape sequences are recognized in either form.

#include "lexer/lexer.hpp"

#include <vector>

namespace cdl::lexer {

namespace {

auto is_blank(std::string_view line) -> bool {
    return line.find_first_not_of(" \t\r\f\v") == std::string_view::npos;
}

} // namespace

auto normalize_multiline(std::string_view raw) -> std::string {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        size_t nl = raw.find('\n', start);
        auto line = raw.substr(start, nl == std::string_view::npos ? raw.npos : nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == std::string_view::npos)
            break;
        start = nl + 1;
    }

    size_t first = 0;
    size_t last = lines.size();
    while (first < last && is_blank(lines[first])) {
        ++first;
    }
    while (last > first && is_blank(lines[last - 1])) {
        --last;
    }

    std::string result;
    for (size_t i = first; i < last; ++i) {
        auto line = lines[i];
        size_t indent = line.find_first_not_of(" \t");
        if (indent != std::string_view::npos) {
            result += ' ';
            result += line.substr(indent);
        }
        if (i + 1 < last) {
            result += '\n';
        }
    }
    return result;
}

auto Lexer::lex_string() -> Token {
    advance(); // opening quote
    size_t content_start = pos_;

    while (!is_at_end() && peek() != '"') {
        if (peek() == '\n') {
            return make_error_token("unterminated string", "L002");
        }
        advance();
    }

    if (is_at_end()) {
        return make_error_token("unterminated string", "L002");
    }

    std::string value(source_.slice(content_start, pos_));
    advance(); // closing quote
    return make_string_token(std::move(value), false);
}

auto Lexer::lex_multiline_string() -> Token {
    pos_ += 3;
    size_t content_start = pos_;

    while (!is_at_end()) {
        if (peek() == '"' && peek_next() == '"' && peek_n(2) == '"') {
            auto raw = source_.slice(content_start, pos_);
            pos_ += 3;
            return make_string_token(normalize_multiline(raw), true);
        }
        advance();
    }

    return make_error_token("unterminated multi-line string", "L003");
}

} // namespace cdl::lexer
