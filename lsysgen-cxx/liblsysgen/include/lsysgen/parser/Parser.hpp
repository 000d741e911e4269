// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_PARSER_PARSER_HPP
#define LSYSGEN_PARSER_PARSER_HPP

#include "../runtime/Grammar.hpp"
#include "../runtime/Symbol.hpp"
#include "../util/log.hpp"
#include "Errors.hpp"
#include "Lexer.hpp"
#include "Token.hpp"

#include <charconv>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace lsysgen {
namespace parser {

/*
 * Builds a GrammarDraft from LSYS source in three fixed phases: the alphabet
 * declaration, the axiom block, then any number of rule blocks. The first
 * problem found is thrown as a ParseError (or a LexError from the lexer).
 *
 * Weight consistency is not checked here; that is the Validator's job.
 */
class Parser {
private:
  Lexer lexer_;
  Token current_{Token::EndType, "", 0};

  Token advance() {
    Token token = current_;
    current_ = lexer_.next();
    return token;
  }

  void fail(const std::string& message) const {
    throw ParseError(message, current_.line);
  }

  void parse_alphabet(runtime::GrammarDraft& draft) {
    if (!current_.is(Token::PercentType)) {
      fail("expected alphabet declaration");
    }
    draft.alphabet_line = advance().line;

    while (true) {
      if (!current_.is(Token::IdentType)) {
        fail("expected letter name");
      }
      if (!draft.alphabet.add(current_.text)) {
        fail("duplicate letter");
      }
      advance();
      if (!current_.is(Token::CommaType)) {
        break;
      }
      advance();
    }
    LSYSGEN_LOG_DEBUG("alphabet of {} letter(s) declared at line {}", draft.alphabet.size(), draft.alphabet_line);
  }

  void parse_axiom(runtime::GrammarDraft& draft) {
    if (!current_.is(Token::AtType)) {
      fail("expected axiom declaration");
    }
    draft.axiom_line = advance().line;
    if (current_.is(Token::AtType)) {
      fail("empty axiom");
    }

    while (true) {
      if (current_.is(Token::StringType)) {
        draft.axiom.push_back(runtime::Symbol::literal(current_.text));
      } else if (current_.is(Token::IdentType)) {
        if (!draft.alphabet.contains(current_.text)) {
          fail("unknown letter in axiom");
        }
        draft.axiom.push_back(runtime::Symbol::letter(current_.text));
      } else if (current_.is(Token::AtType)) {
        fail("expected axiom item");
      } else {
        fail("unterminated axiom");
      }
      advance();

      if (current_.is(Token::CommaType)) {
        advance();
      } else if (current_.is(Token::AtType)) {
        advance();
        break;
      } else {
        fail("unterminated axiom");
      }
    }
    LSYSGEN_LOG_DEBUG("axiom of {} symbol(s) declared at line {}", draft.axiom.size(), draft.axiom_line);
  }

  std::optional<runtime::Weight> parse_weight() {
    if (!current_.is(Token::ColonType)) {
      return std::nullopt;
    }
    advance();
    if (!current_.is(Token::NumberType)) {
      fail("expected weight");
    }
    // Locale independent. A number the grammar accepts may still fall
    // outside the range of double, or round to zero although it has a
    // nonzero digit.
    const std::string& text = current_.text;
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(value)
        || (value == 0.0 && text.find_first_not_of("0.") != std::string::npos)) {
      fail("invalid weight");
    }
    advance();
    bool percent = false;
    if (current_.is(Token::PercentType)) {
      advance();
      percent = true;
    }
    return runtime::Weight(value, percent);
  }

  runtime::ReplacementCase parse_case(const runtime::Alphabet& alphabet) {
    runtime::ReplacementCase replacement({}, std::nullopt, current_.line);
    while (current_.is(Token::StringType) || current_.is(Token::IdentType)) {
      if (current_.is(Token::StringType)) {
        replacement.symbols.push_back(runtime::Symbol::literal(current_.text));
      } else {
        if (!alphabet.contains(current_.text)) {
          fail("unknown letter in rule body");
        }
        replacement.symbols.push_back(runtime::Symbol::letter(current_.text));
      }
      advance();
    }
    replacement.weight = parse_weight();
    return replacement;
  }

  void parse_rule(runtime::GrammarDraft& draft) {
    int line = advance().line;  // '$'
    if (!current_.is(Token::IdentType)) {
      fail("expected letter name");
    }
    if (!draft.alphabet.contains(current_.text)) {
      fail("unknown letter in rule");
    }
    if (draft.rules.contains(current_.text)) {
      fail("duplicate rule for letter");
    }
    runtime::Rule rule(advance().text, {}, line);

    if (!current_.is(Token::EqualsType)) {
      fail("expected '=' in rule");
    }
    advance();

    while (true) {
      runtime::ReplacementCase replacement = parse_case(draft.alphabet);
      if (current_.is(Token::EndType)) {
        fail("unterminated rule");
      }
      if (replacement.symbols.empty()) {
        fail("empty replacement case");
      }
      rule.cases.push_back(std::move(replacement));

      if (current_.is(Token::PipeType)) {
        advance();
      } else if (current_.is(Token::TildeType)) {
        advance();
        break;
      } else {
        fail("unterminated rule");
      }
    }

    LSYSGEN_LOG_DEBUG("rule for {} with {} case(s) at line {}", rule.letter, rule.cases.size(), line);
    std::string letter = rule.letter;
    draft.rules.emplace(letter, std::move(rule));
  }

public:
  explicit Parser(std::string_view src) : lexer_(src) { }

  Parser(const Parser& other) = delete;
  Parser& operator=(const Parser& other) = delete;
  Parser(Parser&& other) = delete;
  Parser& operator=(Parser&& other) = delete;
  ~Parser() = default;

  // Consumes the whole input. A parser is good for a single call.
  runtime::GrammarDraft parse() {
    runtime::GrammarDraft draft;
    advance();
    parse_alphabet(draft);
    parse_axiom(draft);
    while (!current_.is(Token::EndType)) {
      if (!current_.is(Token::DollarType)) {
        fail("unexpected trailing content");
      }
      parse_rule(draft);
    }
    return draft;
  }
};

} // namespace parser
} // namespace lsysgen

#endif // LSYSGEN_PARSER_PARSER_HPP
