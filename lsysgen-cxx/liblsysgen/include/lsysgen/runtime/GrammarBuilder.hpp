// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_GRAMMARBUILDER_HPP
#define LSYSGEN_RUNTIME_GRAMMARBUILDER_HPP

#include "../parser/Validator.hpp"
#include "Grammar.hpp"
#include "Symbol.hpp"

#include <cctype>
#include <format>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace lsysgen {
namespace runtime {

/*
 * Assembles a grammar in code instead of LSYS text. Misuse (undeclared or
 * malformed letters, empty cases, literals that LSYS text cannot hold)
 * throws std::invalid_argument right away; weight consistency is left to
 * the validator run by build().
 *
 * Unlike the text format, cases added for the same letter in several calls
 * accumulate into one rule.
 */
class GrammarBuilder {
public:
  // Numbered placeholder of a fill() recipe, 1-based.
  struct Slot {
    size_t index;
  };
  using RecipeItem = std::variant<Symbol, Slot>;
  using Recipe = std::vector<RecipeItem>;
  // Computes the weight of a filled case from its symbols.
  using WeightFn = std::function<std::optional<Weight>(const std::vector<Symbol>&)>;

private:
  GrammarDraft draft_;

  static bool is_letter_name(const std::string& name) {
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
      return false;
    }
    for (char c : name) {
      if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
        return false;
      }
    }
    return true;
  }

  // Letters must be declared. Literals must survive Grammar::format().
  void check_symbols(const std::vector<Symbol>& symbols) const {
    for (const Symbol& symbol : symbols) {
      if (symbol.is_letter()) {
        if (!draft_.alphabet.contains(symbol.text())) {
          throw std::invalid_argument(std::format("undeclared letter {}", symbol.text()));
        }
      } else if (symbol.text().find_first_of("\"\n") != std::string::npos) {
        throw std::invalid_argument("literal cannot contain a double quote or a newline");
      }
    }
  }

  Rule& rule_for(const std::string& letter) {
    if (!draft_.alphabet.contains(letter)) {
      throw std::invalid_argument(std::format("undeclared letter {}", letter));
    }
    return draft_.rules.try_emplace(letter, letter).first->second;
  }

public:
  GrammarBuilder() = default;

  GrammarBuilder& letter(const std::string& name) {
    if (!is_letter_name(name)) {
      throw std::invalid_argument(std::format("invalid letter name '{}'", name));
    }
    if (!draft_.alphabet.add(name)) {
      throw std::invalid_argument(std::format("duplicate letter {}", name));
    }
    return *this;
  }

  GrammarBuilder& letters(const std::vector<std::string>& names) {
    for (const std::string& name : names) {
      letter(name);
    }
    return *this;
  }

  GrammarBuilder& axiom(const std::vector<Symbol>& symbols) {
    check_symbols(symbols);
    draft_.axiom = symbols;
    return *this;
  }

  GrammarBuilder& replacement(const std::string& letter, const std::vector<Symbol>& symbols,
                              std::optional<Weight> weight = std::nullopt) {
    if (symbols.empty()) {
      throw std::invalid_argument(std::format("empty replacement case for {}", letter));
    }
    check_symbols(symbols);
    rule_for(letter).cases.emplace_back(symbols, weight);
    return *this;
  }

  GrammarBuilder& rule(const std::string& letter, const std::vector<std::vector<Symbol>>& cases) {
    for (const auto& symbols : cases) {
      replacement(letter, symbols);
    }
    return *this;
  }

  // Adds one case per word: `prefix`, the word as a literal, then `suffix`.
  // Every case gets `weight`, if given.
  GrammarBuilder& spread(const std::string& letter, const std::vector<Symbol>& prefix,
                         const std::vector<std::string>& words, const std::vector<Symbol>& suffix = {},
                         std::optional<Weight> weight = std::nullopt) {
    for (const std::string& word : words) {
      std::vector<Symbol> symbols(prefix);
      symbols.push_back(Symbol::literal(word));
      symbols.insert(symbols.end(), suffix.begin(), suffix.end());
      replacement(letter, symbols, weight);
    }
    return *this;
  }

  // Adds one case per row. Each Slot of `recipe` is replaced by the word of
  // the row at its index, as a literal. `weight`, if set, is called with
  // the filled symbols.
  GrammarBuilder& fill(const std::string& letter, const Recipe& recipe,
                       const std::vector<std::vector<std::string>>& rows, const WeightFn& weight = nullptr) {
    for (const auto& row : rows) {
      std::vector<Symbol> symbols;
      for (const RecipeItem& item : recipe) {
        if (const Slot* slot = std::get_if<Slot>(&item)) {
          if (slot->index == 0 || slot->index > row.size()) {
            throw std::invalid_argument(std::format("wrong number of words in row for {}", letter));
          }
          symbols.push_back(Symbol::literal(row[slot->index - 1]));
        } else {
          symbols.push_back(std::get<Symbol>(item));
        }
      }
      replacement(letter, symbols, weight ? weight(symbols) : std::nullopt);
    }
    return *this;
  }

  GrammarBuilder& fill(const std::string& letter, const Recipe& recipe,
                       const std::vector<std::vector<std::string>>& rows, Weight weight) {
    return fill(letter, recipe, rows, [weight](const std::vector<Symbol>&) { return std::optional<Weight>(weight); });
  }

  // Adds one case per template. Names enclosed in `open` and `close` are
  // letters, the text around them is literal. An empty template yields the
  // empty literal.
  GrammarBuilder& convert(const std::string& letter, const std::vector<std::string>& templates,
                          const std::string& open = "@", const std::string& close = "@") {
    if (open.empty() || close.empty()) {
      throw std::invalid_argument("empty letter delimiter");
    }
    for (const std::string& text : templates) {
      std::vector<Symbol> symbols;
      size_t pos = 0;
      while (pos < text.size()) {
        size_t start = text.find(open, pos);
        size_t end = start == std::string::npos ? std::string::npos : text.find(close, start + open.size() + 1);
        if (end == std::string::npos) {
          symbols.push_back(Symbol::literal(text.substr(pos)));
          break;
        }
        if (start > pos) {
          symbols.push_back(Symbol::literal(text.substr(pos, start - pos)));
        }
        symbols.push_back(Symbol::letter(text.substr(start + open.size(), end - start - open.size())));
        pos = end + close.size();
      }
      if (symbols.empty()) {
        symbols.push_back(Symbol::literal(""));
      }
      replacement(letter, symbols);
    }
    return *this;
  }

  const GrammarDraft& draft() const noexcept { return draft_; }

  Grammar build() const { return parser::Validator().validate(draft_); }
};

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_GRAMMARBUILDER_HPP
