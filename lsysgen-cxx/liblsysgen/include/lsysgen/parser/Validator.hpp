// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_PARSER_VALIDATOR_HPP
#define LSYSGEN_PARSER_VALIDATOR_HPP

#include "../runtime/Grammar.hpp"
#include "../util/log.hpp"
#include "Errors.hpp"

#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lsysgen {
namespace parser {

/*
 * Cross-checks a GrammarDraft and freezes it into a Grammar.
 *
 * Weight problems are user errors and are collected, not thrown one by one.
 * Dangling letter references and empty rules or cases cannot come out of
 * the parser, so finding one means a caller assembled a broken draft; that
 * is reported as std::logic_error.
 */
class Validator {
public:
  Validator() = default;
  Validator(const Validator& other) = delete;
  Validator& operator=(const Validator& other) = delete;
  Validator(Validator&& other) = delete;
  Validator& operator=(Validator&& other) = delete;
  ~Validator() = default;

  std::vector<ValidationError> check(const runtime::GrammarDraft& draft) const {
    check_structure(draft);

    std::vector<ValidationError> errors;
    for (const auto& [letter, rule] : draft.rules) {
      check_weights(rule, errors);
    }

    for (const std::string& letter : draft.alphabet) {
      if (!draft.rules.contains(letter)) {
        LSYSGEN_LOG_WARN("letter {} has no rule and is kept as is", letter);
      }
    }
    return errors;
  }

  // Throws ValidationReport listing every problem, if there is any.
  runtime::Grammar validate(runtime::GrammarDraft&& draft) const {
    std::vector<ValidationError> errors = check(draft);
    if (!errors.empty()) {
      throw ValidationReport(errors);
    }
    return runtime::Grammar(std::move(draft));
  }

  runtime::Grammar validate(const runtime::GrammarDraft& draft) const {
    return validate(runtime::GrammarDraft(draft));
  }

private:
  static void check_weights(const runtime::Rule& rule, std::vector<ValidationError>& errors) {
    size_t weighted = 0;
    size_t percent = 0;
    double total = 0.0;
    bool negative = false;
    for (const runtime::ReplacementCase& c : rule.cases) {
      if (!c.weight) {
        continue;
      }
      weighted++;
      if (c.weight->percent) {
        percent++;
      }
      if (c.weight->value < 0.0) {
        negative = true;
      } else {
        total += c.weight->effective();
      }
    }

    if (weighted == 0) {
      return;
    }
    if (weighted != rule.cases.size()) {
      errors.emplace_back("inconsistent weighting", rule.line);
      return;
    }
    if (negative) {
      errors.emplace_back("negative weight", rule.line);
    }
    if (percent != 0 && percent != weighted) {
      errors.emplace_back("mixed weight units", rule.line);
    }
    if (!negative && total <= 0.0) {
      errors.emplace_back("zero total weight", rule.line);
    }
    if (percent == weighted && total > 1.0 + 1e-9) {
      LSYSGEN_LOG_WARN("percentages of the rule for {} (line {}) add up to {}%, they are normalized", rule.letter, rule.line, total * 100.0);
    }
  }

  static void check_symbols(const runtime::Alphabet& alphabet, const std::vector<runtime::Symbol>& symbols, const std::string& where) {
    for (const runtime::Symbol& symbol : symbols) {
      if (symbol.is_letter() && !alphabet.contains(symbol.text())) {
        throw std::logic_error(std::format("undeclared letter {} in {}", symbol.text(), where));
      }
    }
  }

  static void check_structure(const runtime::GrammarDraft& draft) {
    check_symbols(draft.alphabet, draft.axiom, "axiom");
    for (const auto& [letter, rule] : draft.rules) {
      if (letter != rule.letter) {
        throw std::logic_error(std::format("rule for {} is filed under {}", rule.letter, letter));
      }
      if (!draft.alphabet.contains(letter)) {
        throw std::logic_error(std::format("rule for undeclared letter {}", letter));
      }
      if (rule.cases.empty()) {
        throw std::logic_error(std::format("rule for {} has no cases", letter));
      }
      for (const runtime::ReplacementCase& c : rule.cases) {
        if (c.symbols.empty()) {
          throw std::logic_error(std::format("rule for {} has an empty case", letter));
        }
        check_symbols(draft.alphabet, c.symbols, std::format("rule for {}", letter));
      }
    }
  }
};

} // namespace parser
} // namespace lsysgen

#endif // LSYSGEN_PARSER_VALIDATOR_HPP
