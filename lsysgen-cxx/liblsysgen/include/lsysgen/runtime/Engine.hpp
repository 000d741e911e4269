// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_ENGINE_HPP
#define LSYSGEN_RUNTIME_ENGINE_HPP

#include "../util/log.hpp"
#include "../util/random.hpp"
#include "DefaultModel.hpp"
#include "Grammar.hpp"
#include "Listener.hpp"
#include "Model.hpp"
#include "Symbol.hpp"

#include <format>
#include <stdexcept>
#include <vector>

namespace lsysgen {
namespace runtime {

/*
 * Production engine: rewrites every letter of a generation in parallel.
 *
 * Literals and letters without a rule are copied over; a letter with a rule
 * is replaced by the symbols of one case picked by the model. The engine
 * owns its model and listeners, but keeps no state between calls, so one
 * engine may expand any number of generations of any grammar.
 */
class Engine {
private:
  Model* _model;
  std::vector<Listener*> _listeners;

public:
  explicit Engine(Model* model = new DefaultModel(), const std::vector<Listener*>& listeners = {})
      : _model(model), _listeners(listeners) { }

  Engine(const Engine& other) = delete;
  Engine& operator=(const Engine& other) = delete;
  Engine(Engine&& other) = delete;
  Engine& operator=(Engine&& other) = delete;

  virtual ~Engine() {
    delete _model;
    for (Listener* listener : _listeners) {
      delete listener;
    }
  }

  const std::vector<Listener*>& listeners() const noexcept { return _listeners; }

  Generation expand(const Generation& generation, const Grammar& grammar, util::RandomSource& random) const {
    Generation result;
    result.reserve(generation.size());

    for (const Symbol& symbol : generation) {
      if (symbol.is_literal()) {
        result.push_back(symbol);
        continue;
      }
      if (!grammar.alphabet().contains(symbol.text())) {
        throw std::logic_error(std::format("letter {} is not in the alphabet", symbol.text()));
      }

      const Rule* rule = grammar.find_rule(symbol.text());
      if (!rule) {
        result.push_back(symbol);
        continue;
      }

      int choice = _model->choice(rule, rule->weights(), random);
      if (choice < 0 || static_cast<size_t>(choice) >= rule->cases.size()) {
        throw std::logic_error(std::format("model chose case {} of {} for {}", choice, rule->cases.size(), rule->letter));
      }
      LSYSGEN_LOG_TRACE("{} -> case {}", rule->letter, choice);
      _rewrite(rule, choice);

      const std::vector<Symbol>& symbols = rule->cases[choice].symbols;
      result.insert(result.end(), symbols.begin(), symbols.end());
    }
    return result;
  }

  void _enter_generation(int index, const Generation& source) const {
    for (Listener* listener : _listeners) {
      listener->enter_generation(index, source);
    }
  }

  void _exit_generation(int index, const Generation& result) const {
    for (int i = _listeners.size() - 1; i >= 0; i--) {
      _listeners[i]->exit_generation(index, result);
    }
  }

private:
  void _rewrite(const Rule* rule, int choice) const {
    for (Listener* listener : _listeners) {
      listener->rewrite(rule, choice);
    }
  }
};

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_ENGINE_HPP
