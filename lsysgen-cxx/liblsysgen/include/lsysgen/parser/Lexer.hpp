// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_PARSER_LEXER_HPP
#define LSYSGEN_PARSER_LEXER_HPP

#include "../util/log.hpp"
#include "Errors.hpp"
#include "Token.hpp"

#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace lsysgen {
namespace parser {

/*
 * Turns LSYS source text into tokens on demand. A lexer is consumed once:
 * next() keeps returning the end token after the input is exhausted.
 *
 * Comment lines (first non-blank character is '#') are dropped; whitespace
 * outside strings only separates tokens.
 */
class Lexer {
private:
  std::string src_;
  size_t pos_{0};
  int line_{1};
  bool line_start_{true};

  static bool is_ident_start(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  }

  static bool is_ident_char(char c) noexcept { return is_ident_start(c) || is_digit(c); }

  static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

  bool at_end() const noexcept { return pos_ >= src_.size(); }

  void skip_comment() {
    while (!at_end() && src_[pos_] != '\n') {
      ++pos_;
    }
  }

  // Skips whitespace and comment lines, keeping track of line numbers.
  void skip_blank() {
    while (!at_end()) {
      char c = src_[pos_];
      if (c == '\n') {
        ++line_;
        line_start_ = true;
        ++pos_;
      } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
        ++pos_;
      } else if (c == '#' && line_start_) {
        skip_comment();
      } else {
        break;
      }
    }
  }

  Token lex_string() {
    size_t start = ++pos_;
    while (!at_end() && src_[pos_] != '"') {
      if (src_[pos_] == '\n') {
        throw LexError("unterminated string", line_);
      }
      ++pos_;
    }
    if (at_end()) {
      throw LexError("unterminated string", line_);
    }
    std::string text = src_.substr(start, pos_ - start);
    ++pos_;
    return Token(Token::StringType, text, line_);
  }

  Token lex_number() {
    size_t start = pos_;
    while (!at_end() && is_digit(src_[pos_])) {
      ++pos_;
    }
    if (pos_ + 1 < src_.size() && src_[pos_] == '.' && is_digit(src_[pos_ + 1])) {
      ++pos_;
      while (!at_end() && is_digit(src_[pos_])) {
        ++pos_;
      }
    }
    return Token(Token::NumberType, src_.substr(start, pos_ - start), line_);
  }

  Token lex_ident() {
    size_t start = pos_;
    while (!at_end() && is_ident_char(src_[pos_])) {
      ++pos_;
    }
    return Token(Token::IdentType, src_.substr(start, pos_ - start), line_);
  }

public:
  explicit Lexer(std::string_view src) : src_(src) { }

  Lexer(const Lexer& other) = delete;
  Lexer& operator=(const Lexer& other) = delete;
  Lexer(Lexer&& other) = default;
  Lexer& operator=(Lexer&& other) = default;
  ~Lexer() = default;

  int line() const noexcept { return line_; }

  Token next() {
    skip_blank();
    if (at_end()) {
      return Token(Token::EndType, "", line_);
    }

    line_start_ = false;
    char c = src_[pos_];
    switch (c) {
      case '%': ++pos_; return Token(Token::PercentType, "%", line_);
      case '@': ++pos_; return Token(Token::AtType, "@", line_);
      case '$': ++pos_; return Token(Token::DollarType, "$", line_);
      case '=': ++pos_; return Token(Token::EqualsType, "=", line_);
      case '|': ++pos_; return Token(Token::PipeType, "|", line_);
      case '~': ++pos_; return Token(Token::TildeType, "~", line_);
      case ':': ++pos_; return Token(Token::ColonType, ":", line_);
      case ',': ++pos_; return Token(Token::CommaType, ",", line_);
      case '"': return lex_string();
      default: break;
    }
    if (is_digit(c)) {
      return lex_number();
    }
    if (is_ident_start(c)) {
      return lex_ident();
    }
    throw LexError(std::format("unexpected character '{}'", c), line_);
  }

  // Drains the lexer. The end token is not included.
  std::vector<Token> tokenize() {
    std::vector<Token> tokens;
    for (Token token = next(); !token.is(Token::EndType); token = next()) {
      tokens.push_back(token);
    }
    LSYSGEN_LOG_TRACE("lexed {} tokens over {} lines", tokens.size(), line_);
    return tokens;
  }
};

} // namespace parser
} // namespace lsysgen

#endif // LSYSGEN_PARSER_LEXER_HPP
