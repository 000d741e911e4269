// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_PARSER_TOKEN_HPP
#define LSYSGEN_PARSER_TOKEN_HPP

#include <format>
#include <string>

namespace lsysgen {
namespace parser {

class Token {
public:
  enum TokenType {
    EndType = 0,
    PercentType,
    AtType,
    DollarType,
    EqualsType,
    PipeType,
    TildeType,
    ColonType,
    CommaType,
    IdentType,
    StringType,
    NumberType
  };

  TokenType type;
  std::string text;
  int line;

  Token(TokenType type, const std::string& text, int line) : type(type), text(text), line(line) { }

  bool is(TokenType t) const noexcept { return type == t; }

  static const char* type_name(TokenType type) {
    switch (type) {
      case EndType: return "end of input";
      case PercentType: return "'%'";
      case AtType: return "'@'";
      case DollarType: return "'$'";
      case EqualsType: return "'='";
      case PipeType: return "'|'";
      case TildeType: return "'~'";
      case ColonType: return "':'";
      case CommaType: return "','";
      case IdentType: return "identifier";
      case StringType: return "string";
      case NumberType: return "number";
    }
    return "token";
  }

  std::string format() const {
    switch (type) {
      case IdentType:
      case NumberType:
        return std::format("{} '{}'", type_name(type), text);
      case StringType:
        return std::format("string \"{}\"", text);
      default:
        return type_name(type);
    }
  }
};

} // namespace parser
} // namespace lsysgen

#endif // LSYSGEN_PARSER_TOKEN_HPP
