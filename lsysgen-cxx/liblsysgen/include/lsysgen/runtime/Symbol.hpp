// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_SYMBOL_HPP
#define LSYSGEN_RUNTIME_SYMBOL_HPP

#include <format>
#include <string>
#include <vector>

namespace lsysgen {
namespace runtime {

/*
 * A single symbol of an axiom, a replacement case or a generation: either a
 * letter of the alphabet (rewritten by its rule) or an opaque literal
 * string (never rewritten).
 */
class Symbol {
public:
  enum SymbolType { LetterType = 0, LiteralType };

private:
  SymbolType type_;
  std::string text_;

  Symbol(SymbolType type, const std::string& text) : type_(type), text_(text) { }

public:
  Symbol(const Symbol& other) = default;
  Symbol& operator=(const Symbol& other) = default;
  Symbol(Symbol&& other) = default;
  Symbol& operator=(Symbol&& other) = default;
  ~Symbol() = default;

  static Symbol letter(const std::string& name) { return Symbol(LetterType, name); }
  static Symbol literal(const std::string& text) { return Symbol(LiteralType, text); }

  SymbolType type() const noexcept { return type_; }
  bool is_letter() const noexcept { return type_ == LetterType; }
  bool is_literal() const noexcept { return type_ == LiteralType; }

  // Name of a letter, or contents of a literal.
  const std::string& text() const noexcept { return text_; }

  bool operator==(const Symbol& other) const noexcept { return type_ == other.type_ && text_ == other.text_; }
  bool operator!=(const Symbol& other) const noexcept { return !(*this == other); }

  // Letter(NAME) or Literal("text")
  std::string format() const {
    return is_letter() ? std::format("Letter({})", text_) : std::format("Literal(\"{}\")", text_);
  }
};

// An ordered run of symbols. Generation 0 is the axiom; every expansion step
// produces a new one.
using Generation = std::vector<Symbol>;

inline std::string format_generation(const Generation& generation) {
  std::string s = "[";
  for (size_t i = 0; i < generation.size(); ++i) {
    if (i > 0) {
      s += ", ";
    }
    s += generation[i].format();
  }
  return s + "]";
}

} // namespace runtime
} // namespace lsysgen

template<>
struct std::formatter<lsysgen::runtime::Symbol> {
  template<class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template<class FmtContext>
  auto format(const lsysgen::runtime::Symbol& symbol, FmtContext& ctx) const {
    return std::format_to(ctx.out(), "{}", symbol.format());
  }
};

#endif // LSYSGEN_RUNTIME_SYMBOL_HPP
