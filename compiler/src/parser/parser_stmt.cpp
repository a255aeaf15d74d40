//! # Statement Parsing
//!
//! One method per statement keyword. Each method is entered with the keyword
//! already consumed, so `previous()` is the keyword token and
//! `statement_line_` its line.
//!
//! ## Attachment Context
//!
//! `current_command_` and `current_topic_` select where `flag`, `arg`,
//! `attr`, `example` and `text` land. `global` clears both, `cmd` only sets
//! the command and `topic` only sets the topic.

#include "common/suggest.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <charconv>
#include <system_error>
#include <unordered_map>

namespace cdl::parser {

using lexer::TokenKind;

auto Parser::parse_statement() -> Status {
    const auto& keyword = peek();

    if (keyword.is_error()) {
        return lexical_error(keyword);
    }
    if (!keyword.is(TokenKind::Identifier)) {
        return error_at(keyword, "expected statement keyword, found " +
                                     std::string(lexer::token_kind_to_string(keyword.kind)));
    }

    using Handler = auto (Parser::*)() -> Status;
    static const std::unordered_map<std::string_view, Handler> handlers = {
        {"global", &Parser::parse_global}, {"cmd", &Parser::parse_cmd},
        {"flag", &Parser::parse_flag},     {"arg", &Parser::parse_arg},
        {"attr", &Parser::parse_attr},     {"param", &Parser::parse_attr},
        {"name", &Parser::parse_name},     {"example", &Parser::parse_example},
        {"topic", &Parser::parse_topic},   {"text", &Parser::parse_text},
    };

    auto it = handlers.find(keyword.lexeme);
    if (it == handlers.end()) {
        auto error = error_at(keyword, "unknown keyword '" + std::string(keyword.lexeme) + "'");
        for (const auto& suggestion : find_similar(keyword.lexeme, statement_keywords(), 1)) {
            error.notes.push_back("did you mean '" + suggestion + "'?");
        }
        return error;
    }

    statement_line_ = keyword.line();
    CDL_LOG_TRACE("parser", "line " << statement_line_ << ": " << keyword.lexeme);
    advance();
    return (this->*(it->second))();
}

auto Parser::parse_global() -> Status {
    current_command_.reset();
    current_topic_.reset();
    return std::nullopt;
}

auto Parser::parse_cmd() -> Status {
    if (!check_same_line(TokenKind::Identifier)) {
        if (check(TokenKind::Error)) {
            return lexical_error(peek());
        }
        return error_at(peek(), "expected command name or path after 'cmd'");
    }

    std::optional<NodeId> parent;
    NodeId current = 0;
    while (check_same_line(TokenKind::Identifier)) {
        const auto& segment = advance();
        auto existing = tree_.find_child(parent, segment.lexeme);
        current = existing ? *existing
                           : tree_.add_node(parent, std::string(segment.lexeme), segment.span);
        parent = current;
    }

    if (check(TokenKind::StringLiteral)) {
        tree_.node(current).description = advance().string_value();
    }

    current_command_ = current;
    return std::nullopt;
}

auto Parser::parse_flag() -> Status {
    auto start = previous().span;

    auto name = expect(TokenKind::Identifier, "expected flag name");
    if (is_err(name))
        return unwrap_err(name);

    auto type = expect(TokenKind::Identifier, "expected flag type");
    if (is_err(type))
        return unwrap_err(type);

    auto desc = expect(TokenKind::StringLiteral, "expected flag description");
    if (is_err(desc))
        return unwrap_err(desc);

    FlagDecl flag{.name = std::string(unwrap(name).lexeme),
                  .short_name = {},
                  .type_name = std::string(unwrap(type).lexeme),
                  .description = unwrap(desc).string_value(),
                  .span = {}};
    if (check_same_line(TokenKind::Identifier)) {
        flag.short_name = std::string(advance().lexeme);
    }
    flag.span = SourceSpan::merge(start, previous().span);

    auto& scope = current_command_ ? tree_.node(*current_command_).flags : tree_.global_flags;
    scope.push_back(std::move(flag));
    return std::nullopt;
}

auto Parser::parse_arg() -> Status {
    auto start = previous().span;
    if (!current_command_) {
        return error_at(previous(), "'arg' must follow a 'cmd'", "P002");
    }

    auto name = expect(TokenKind::Identifier, "expected argument name");
    if (is_err(name))
        return unwrap_err(name);

    auto type = expect(TokenKind::Identifier, "expected argument type");
    if (is_err(type))
        return unwrap_err(type);

    auto desc = expect(TokenKind::StringLiteral, "expected argument description");
    if (is_err(desc))
        return unwrap_err(desc);

    tree_.node(*current_command_)
        .args.push_back(ArgDecl{.name = std::string(unwrap(name).lexeme),
                                .type_name = std::string(unwrap(type).lexeme),
                                .description = unwrap(desc).string_value(),
                                .span = SourceSpan::merge(start, previous().span)});
    return std::nullopt;
}

auto Parser::parse_attr() -> Status {
    auto start = previous().span;

    auto name = expect(TokenKind::Identifier, "expected attribute name");
    if (is_err(name))
        return unwrap_err(name);

    if (!match(TokenKind::Equals)) {
        if (check(TokenKind::Error)) {
            return lexical_error(peek());
        }
        return error_at(peek(), "expected '=' after attribute name");
    }

    auto value = parse_attr_value();
    if (is_err(value))
        return unwrap_err(value);

    Attribute attr{.name = std::string(unwrap(name).lexeme),
                   .value = std::move(unwrap(value)),
                   .span = SourceSpan::merge(start, previous().span)};

    auto& scope = current_command_ ? tree_.node(*current_command_).attrs : tree_.global_attrs;
    set_attr(scope, std::move(attr));
    return std::nullopt;
}

auto Parser::parse_attr_value() -> Result<AttrValue, ParseError> {
    const auto& token = peek();

    switch (token.kind) {
    case TokenKind::Identifier:
        if (token.lexeme == "true" || token.lexeme == "false") {
            advance();
            return AttrValue{token.lexeme == "true"};
        }
        return error_at(token, "expected bool, string or number value, found identifier '" +
                                   std::string(token.lexeme) + "'");
    case TokenKind::StringLiteral:
        advance();
        return AttrValue{token.string_value()};
    case TokenKind::IntLiteral: {
        int64_t number = 0;
        const char* first = token.lexeme.data();
        const char* last = first + token.lexeme.size();
        auto [ptr, ec] = std::from_chars(first, last, number);
        if (ec != std::errc{} || ptr != last) {
            return error_at(token, "invalid number '" + std::string(token.lexeme) + "'");
        }
        advance();
        return AttrValue{number};
    }
    case TokenKind::Error:
        return lexical_error(token);
    default:
        return error_at(token, "expected attribute value, found " +
                                   std::string(lexer::token_kind_to_string(token.kind)));
    }
}

auto Parser::parse_name() -> Status {
    if (current_command_) {
        return error_at(previous(), "'name' must be in the global section", "P002");
    }
    if (tree_.app_name) {
        return error_at(previous(), "application name is already set to '" + *tree_.app_name + "'",
                        "P002");
    }

    auto app = expect(TokenKind::StringLiteral, "expected application name string");
    if (is_err(app))
        return unwrap_err(app);

    auto tagline = expect(TokenKind::StringLiteral, "expected tagline string");
    if (is_err(tagline))
        return unwrap_err(tagline);

    tree_.app_name = unwrap(app).string_value();
    tree_.tagline = unwrap(tagline).string_value();
    return std::nullopt;
}

auto Parser::parse_example() -> Status {
    if (!current_command_) {
        return error_at(previous(), "'example' must follow a 'cmd'", "P002");
    }

    auto text = expect(TokenKind::StringLiteral, "expected example string");
    if (is_err(text))
        return unwrap_err(text);

    tree_.node(*current_command_).examples.push_back(unwrap(text).string_value());
    return std::nullopt;
}

auto Parser::parse_topic() -> Status {
    auto start = previous().span;

    auto name = expect(TokenKind::Identifier, "expected topic name");
    if (is_err(name))
        return unwrap_err(name);

    auto desc = expect(TokenKind::StringLiteral, "expected topic description");
    if (is_err(desc))
        return unwrap_err(desc);

    std::string topic_name(unwrap(name).lexeme);
    if (tree_.find_topic(topic_name)) {
        return error_at(unwrap(name), "topic '" + topic_name + "' is already declared", "P002");
    }

    tree_.topics.push_back(Topic{.name = std::move(topic_name),
                                 .description = unwrap(desc).string_value(),
                                 .text = {},
                                 .span = SourceSpan::merge(start, previous().span)});
    current_topic_ = static_cast<TopicId>(tree_.topics.size() - 1);
    return std::nullopt;
}

auto Parser::parse_text() -> Status {
    if (!current_topic_) {
        return error_at(previous(), "'text' must follow a 'topic'", "P002");
    }

    auto body = expect(TokenKind::StringLiteral, "expected text string");
    if (is_err(body))
        return unwrap_err(body);

    tree_.topics[*current_topic_].text = unwrap(body).string_value();
    return std::nullopt;
}

} // namespace cdl::parser
