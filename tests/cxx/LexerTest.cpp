// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <lsysgen/parser/Errors.hpp>
#include <lsysgen/parser/Lexer.hpp>
#include <lsysgen/parser/Token.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace lsysgen::parser;

namespace {

std::vector<Token::TokenType> types(const std::vector<Token>& tokens) {
  std::vector<Token::TokenType> result;
  for (const Token& token : tokens) {
    result.push_back(token.type);
  }
  return result;
}

} // namespace

TEST(LexerTest, Punctuation) {
  std::vector<Token> tokens = Lexer("% @ $ = | ~ : ,").tokenize();
  std::vector<Token::TokenType> expected{Token::PercentType, Token::AtType, Token::DollarType, Token::EqualsType,
                                         Token::PipeType, Token::TildeType, Token::ColonType, Token::CommaType};
  EXPECT_EQ(types(tokens), expected);
}

TEST(LexerTest, RuleBlock) {
  std::vector<Token> tokens = Lexer("$NOUN = \"dog \":2.5 | DET_2 \"cat\" ~").tokenize();
  ASSERT_EQ(tokens.size(), 10u);
  EXPECT_TRUE(tokens[1].is(Token::IdentType));
  EXPECT_EQ(tokens[1].text, "NOUN");
  EXPECT_TRUE(tokens[3].is(Token::StringType));
  EXPECT_EQ(tokens[3].text, "dog ");
  EXPECT_TRUE(tokens[5].is(Token::NumberType));
  EXPECT_EQ(tokens[5].text, "2.5");
  EXPECT_EQ(tokens[7].text, "DET_2");
  EXPECT_EQ(tokens[8].text, "cat");
}

TEST(LexerTest, StringsAreRaw) {
  std::vector<Token> tokens = Lexer("\"a\\n # | ~\" \"\"").tokenize();
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].text, "a\\n # | ~");
  EXPECT_TRUE(tokens[1].is(Token::StringType));
  EXPECT_EQ(tokens[1].text, "");
}

TEST(LexerTest, CommentLines) {
  std::vector<Token> tokens = Lexer("# header\n%A\n   # indented comment, with \"quote\n@A@\n").tokenize();
  std::vector<Token::TokenType> expected{Token::PercentType, Token::IdentType, Token::AtType, Token::IdentType, Token::AtType};
  EXPECT_EQ(types(tokens), expected);
  EXPECT_EQ(tokens[0].line, 2);
  EXPECT_EQ(tokens[2].line, 4);
}

TEST(LexerTest, HashInsideLineIsNotAComment) {
  Lexer lexer("%A # trailing");
  lexer.next();
  lexer.next();
  try {
    lexer.next();
    FAIL() << "expected LexError";
  } catch (const LexError& e) {
    EXPECT_EQ(e.message(), "unexpected character '#'");
    EXPECT_EQ(e.line(), 1);
  }
}

TEST(LexerTest, NumberWithoutFraction) {
  std::vector<Token> tokens = Lexer("3 12.75").tokenize();
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].text, "3");
  EXPECT_EQ(tokens[1].text, "12.75");

  EXPECT_THROW(Lexer("1.").tokenize(), LexError);
}

TEST(LexerTest, UnterminatedStringAtEndOfLine) {
  try {
    Lexer("%A\n@\"open\n@").tokenize();
    FAIL() << "expected LexError";
  } catch (const LexError& e) {
    EXPECT_EQ(e.message(), "unterminated string");
    EXPECT_EQ(e.line(), 2);
    EXPECT_STREQ(e.what(), "line 2: unterminated string");
  }
}

TEST(LexerTest, UnterminatedStringAtEndOfFile) {
  EXPECT_THROW(Lexer("\"open").tokenize(), LexError);
}

TEST(LexerTest, UnexpectedCharacter) {
  try {
    Lexer("%A\n@A@\n$A = \"x\" ; ~").tokenize();
    FAIL() << "expected LexError";
  } catch (const LexError& e) {
    EXPECT_EQ(e.message(), "unexpected character ';'");
    EXPECT_EQ(e.line(), 3);
  }
}

TEST(LexerTest, EndIsSticky) {
  Lexer lexer("A");
  EXPECT_TRUE(lexer.next().is(Token::IdentType));
  EXPECT_TRUE(lexer.next().is(Token::EndType));
  EXPECT_TRUE(lexer.next().is(Token::EndType));
}

TEST(LexerTest, LineCounting) {
  Lexer lexer("\n\n  A\r\n\tB");
  Token a = lexer.next();
  Token b = lexer.next();
  EXPECT_EQ(a.line, 3);
  EXPECT_EQ(b.line, 4);
}

TEST(TokenTest, Format) {
  EXPECT_EQ(Token(Token::IdentType, "NOUN", 1).format(), "identifier 'NOUN'");
  EXPECT_EQ(Token(Token::StringType, "dog ", 1).format(), "string \"dog \"");
  EXPECT_EQ(Token(Token::TildeType, "~", 1).format(), "'~'");
  EXPECT_EQ(Token(Token::EndType, "", 1).format(), "end of input");
}
