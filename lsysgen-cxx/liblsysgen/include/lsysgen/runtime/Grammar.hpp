// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_GRAMMAR_HPP
#define LSYSGEN_RUNTIME_GRAMMAR_HPP

#include "Symbol.hpp"

#include <format>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace lsysgen {

namespace parser {
class Validator;
} // namespace parser

namespace runtime {

class Weight {
public:
  double value;
  bool percent;

  constexpr Weight() noexcept : Weight(0.0, false) {}
  constexpr explicit Weight(double value, bool percent = false) noexcept : value(value), percent(percent) {}

  // Relative weight used for selection. Percentages count as fractions.
  constexpr double effective() const noexcept { return percent ? value / 100.0 : value; }

  constexpr bool operator==(const Weight& other) const noexcept {
    return value == other.value && percent == other.percent;
  }

  std::string format() const {
    std::string s = std::format("{}", value);
    if (s.find_first_of("eE") != std::string::npos) {
      s = std::format("{:f}", value);
    }
    return percent ? s + "%" : s;
  }
};

class ReplacementCase {
public:
  std::vector<Symbol> symbols;
  std::optional<Weight> weight;
  int line;

  explicit ReplacementCase(const std::vector<Symbol>& symbols = {}, std::optional<Weight> weight = std::nullopt, int line = 0)
      : symbols(symbols), weight(weight), line(line) { }

  bool weighted() const noexcept { return weight.has_value(); }

  bool operator==(const ReplacementCase& other) const noexcept {
    return symbols == other.symbols && weight == other.weight;
  }
};

class Rule {
public:
  std::string letter;
  std::vector<ReplacementCase> cases;
  int line;

  explicit Rule(const std::string& letter, const std::vector<ReplacementCase>& cases = {}, int line = 0)
      : letter(letter), cases(cases), line(line) { }

  bool weighted() const noexcept { return !cases.empty() && cases.front().weighted(); }

  // One selection weight per case: the effective weight of weighted cases,
  // 1 for every case of an unweighted rule.
  std::vector<double> weights() const {
    std::vector<double> result;
    result.reserve(cases.size());
    for (const ReplacementCase& c : cases) {
      result.push_back(c.weight ? c.weight->effective() : 1.0);
    }
    return result;
  }

  bool operator==(const Rule& other) const noexcept { return letter == other.letter && cases == other.cases; }
};

// Letters in declaration order, with constant time membership test.
class Alphabet {
private:
  std::vector<std::string> letters_;
  std::unordered_set<std::string> index_;

public:
  Alphabet() = default;

  // Returns false if the letter was already declared.
  bool add(const std::string& letter) {
    if (!index_.insert(letter).second) {
      return false;
    }
    letters_.push_back(letter);
    return true;
  }

  bool contains(const std::string& letter) const { return index_.contains(letter); }
  size_t size() const noexcept { return letters_.size(); }
  bool empty() const noexcept { return letters_.empty(); }

  std::vector<std::string>::const_iterator begin() const { return letters_.begin(); }
  std::vector<std::string>::const_iterator end() const { return letters_.end(); }
  const std::vector<std::string>& letters() const noexcept { return letters_; }

  bool operator==(const Alphabet& other) const { return letters_ == other.letters_; }
};

using RuleTable = std::map<std::string, Rule>;

// Output of the parser (or of GrammarBuilder) before validation.
struct GrammarDraft {
  Alphabet alphabet;
  Generation axiom;
  RuleTable rules;
  int alphabet_line{0};
  int axiom_line{0};
};

/*
 * A validated, immutable L-system grammar. Only parser::Validator creates
 * instances, so holding a Grammar implies every invariant was checked.
 */
class Grammar {
private:
  Alphabet alphabet_;
  Generation axiom_;
  RuleTable rules_;

  explicit Grammar(GrammarDraft&& draft)
      : alphabet_(std::move(draft.alphabet)), axiom_(std::move(draft.axiom)), rules_(std::move(draft.rules)) { }

  friend class parser::Validator;

public:
  Grammar(const Grammar& other) = default;
  Grammar& operator=(const Grammar& other) = delete;
  Grammar(Grammar&& other) = default;
  Grammar& operator=(Grammar&& other) = delete;
  ~Grammar() = default;

  const Alphabet& alphabet() const noexcept { return alphabet_; }
  const Generation& axiom() const noexcept { return axiom_; }
  const RuleTable& rules() const noexcept { return rules_; }

  const Rule* find_rule(const std::string& letter) const {
    auto it = rules_.find(letter);
    return it != rules_.end() ? &it->second : nullptr;
  }

  // Canonical LSYS text of the grammar. Rules are listed in alphabet order.
  std::string format() const {
    std::string s = "%";
    bool first = true;
    for (const std::string& letter : alphabet_) {
      s += first ? letter : ", " + letter;
      first = false;
    }
    s += "\n@";
    for (size_t i = 0; i < axiom_.size(); ++i) {
      s += (i > 0 ? ", " : "") + format_symbol(axiom_[i]);
    }
    s += "@\n";
    for (const std::string& letter : alphabet_) {
      const Rule* rule = find_rule(letter);
      if (!rule) {
        continue;
      }
      s += "$" + letter + " =";
      for (size_t i = 0; i < rule->cases.size(); ++i) {
        const ReplacementCase& c = rule->cases[i];
        s += i > 0 ? " |" : "";
        for (const Symbol& symbol : c.symbols) {
          s += " " + format_symbol(symbol);
        }
        if (c.weight) {
          s += ":" + c.weight->format();
        }
      }
      s += " ~\n";
    }
    return s;
  }

private:
  static std::string format_symbol(const Symbol& symbol) {
    return symbol.is_letter() ? symbol.text() : "\"" + symbol.text() + "\"";
  }
};

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_GRAMMAR_HPP
