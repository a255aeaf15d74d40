#include "lexer/lexer.hpp"
#include "lexer/source.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace cdl;
using namespace cdl::lexer;

class LexerTest : public ::testing::Test {
protected:
    // Keep source alive so Token.lexeme (string_view) remains valid
    std::unique_ptr<Source> source_;
    std::vector<LexerError> errors_;

    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code, "test.cdl"));
        Lexer lexer(*source_);
        auto tokens = lexer.tokenize();
        errors_ = lexer.errors();
        return tokens;
    }

    auto lex_one(const std::string& code) -> Token {
        auto tokens = lex(code);
        EXPECT_GE(tokens.size(), 1);
        return tokens[0];
    }

    auto kinds(const std::string& code) -> std::vector<TokenKind> {
        std::vector<TokenKind> result;
        for (const auto& token : lex(code)) {
            result.push_back(token.kind);
        }
        return result;
    }
};

// Identifiers
TEST_F(LexerTest, Identifiers) {
    auto token = lex_one("remote");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.lexeme, "remote");
}

TEST_F(LexerTest, IdentifierPunctuation) {
    EXPECT_EQ(lex_one("dry-run").lexeme, "dry-run");
    EXPECT_EQ(lex_one("remote/add").lexeme, "remote/add");
    EXPECT_EQ(lex_one("_private").lexeme, "_private");
    EXPECT_EQ(lex_one(".hidden").lexeme, ".hidden");
    EXPECT_EQ(lex_one("v1.2").lexeme, "v1.2");
}

TEST_F(LexerTest, KeywordsAreIdentifiers) {
    for (const char* word : {"cmd", "flag", "arg", "attr", "true", "false", "global"}) {
        auto token = lex_one(word);
        EXPECT_EQ(token.kind, TokenKind::Identifier) << word;
        EXPECT_EQ(token.lexeme, word);
    }
}

// Numbers
TEST_F(LexerTest, Numbers) {
    auto token = lex_one("42");
    EXPECT_EQ(token.kind, TokenKind::IntLiteral);
    EXPECT_EQ(token.lexeme, "42");
}

TEST_F(LexerTest, AttributeStatement) {
    EXPECT_EQ(kinds("attr retries = 3"),
              (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Identifier,
                                      TokenKind::Equals, TokenKind::IntLiteral, TokenKind::Eof}));
}

// Strings
TEST_F(LexerTest, SimpleString) {
    auto token = lex_one("\"Add a remote\"");
    EXPECT_EQ(token.kind, TokenKind::StringLiteral);
    EXPECT_EQ(token.string_value(), "Add a remote");
    EXPECT_EQ(token.lexeme, "\"Add a remote\"");
}

TEST_F(LexerTest, EmptyString) {
    auto token = lex_one("\"\"");
    EXPECT_EQ(token.kind, TokenKind::StringLiteral);
    EXPECT_EQ(token.string_value(), "");
}

TEST_F(LexerTest, StringKeepsHashAndBackslash) {
    EXPECT_EQ(lex_one("\"issue #12 \\n\"").string_value(), "issue #12 \\n");
}

TEST_F(LexerTest, MultilineString) {
    auto token = lex_one("\"\"\"\n    First line.\n      Second line.\n  \"\"\"");
    EXPECT_EQ(token.kind, TokenKind::StringLiteral);
    EXPECT_EQ(token.string_value(), " First line.\n Second line.");
    EXPECT_TRUE(std::get<StringValue>(token.value).multiline);
}

TEST_F(LexerTest, MultilineKeepsInteriorBlankLines) {
    EXPECT_EQ(normalize_multiline("a\n\n   b"), " a\n\n b");
}

TEST_F(LexerTest, MultilineStripsCarriageReturns) {
    EXPECT_EQ(normalize_multiline("\r\n  x\r\n  y\r\n"), " x\n y");
}

// Comments and whitespace
TEST_F(LexerTest, CommentsSkipped) {
    auto tokens = lex("# heading\ncmd status # trailing\n# end");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].lexeme, "cmd");
    EXPECT_EQ(tokens[1].lexeme, "status");
    EXPECT_TRUE(tokens[2].is_eof());
}

TEST_F(LexerTest, EmptyInput) {
    auto tokens = lex("  \n\t ");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokens[0].is_eof());
}

// Locations
TEST_F(LexerTest, TokenLocations) {
    auto tokens = lex("cmd remote\n  flag force");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[1].span.start.line, 1u);
    EXPECT_EQ(tokens[1].span.start.column, 5u);
    EXPECT_EQ(tokens[3].span.start.line, 2u);
    EXPECT_EQ(tokens[3].span.start.column, 8u);
    EXPECT_EQ(tokens[3].span.end.column, 12u);
    EXPECT_EQ(tokens[3].span.start.file, "test.cdl");
}

// Errors
TEST_F(LexerTest, UnexpectedCharacter) {
    auto tokens = lex("cmd @ status");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(tokens[1].is_error());
    EXPECT_EQ(tokens[1].error_message(), "unexpected character '@'");
    EXPECT_EQ(tokens[1].error_code(), "L001");
    // Lexing continues after a fault
    EXPECT_EQ(tokens[2].lexeme, "status");

    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].code, "L001");
    EXPECT_EQ(errors_[0].span.start.column, 5u);
}

TEST_F(LexerTest, UnterminatedString) {
    auto tokens = lex("cmd x \"no end\nflag");
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "unterminated string");
    EXPECT_EQ(errors_[0].code, "L002");
    EXPECT_EQ(errors_[0].span.start.line, 1u);
    EXPECT_EQ(tokens.back().kind, TokenKind::Eof);
}

TEST_F(LexerTest, UnterminatedStringAtEof) {
    lex("\"open");
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].code, "L002");
}

TEST_F(LexerTest, UnterminatedMultilineString) {
    auto token = lex_one("\"\"\"\nnever closed\n");
    EXPECT_TRUE(token.is_error());
    EXPECT_EQ(token.error_message(), "unterminated multi-line string");
    EXPECT_EQ(token.error_code(), "L003");
}

TEST_F(LexerTest, TokenKindNames) {
    EXPECT_EQ(token_kind_to_string(TokenKind::Identifier), "identifier");
    EXPECT_EQ(token_kind_to_string(TokenKind::StringLiteral), "string");
    EXPECT_EQ(token_kind_to_string(TokenKind::Eof), "end of input");
}

// Source
TEST(SourceTest, LocationAndLines) {
    auto source = Source::from_string("one\r\ntwo\nthree", "s.cdl");
    EXPECT_EQ(source.line_count(), 3u);
    EXPECT_EQ(source.line(1), "one");
    EXPECT_EQ(source.line(3), "three");
    EXPECT_EQ(source.line(4), "");

    auto loc = source.location(6);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 2u);
}

TEST(SourceTest, MissingFile) {
    auto result = Source::from_file("/nonexistent/dir/missing.cdl");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "cannot open file: /nonexistent/dir/missing.cdl");
}

TEST(SourceTest, ReadsFile) {
    auto result = Source::from_file(std::string(CDL_TEST_DATA_DIR) + "/git.cdl");
    ASSERT_TRUE(is_ok(result));
    EXPECT_GT(unwrap(result).line_count(), 10u);
}
