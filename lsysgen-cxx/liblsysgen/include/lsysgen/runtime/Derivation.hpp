// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_DERIVATION_HPP
#define LSYSGEN_RUNTIME_DERIVATION_HPP

#include "../util/log.hpp"
#include "../util/random.hpp"
#include "Engine.hpp"
#include "Grammar.hpp"
#include "Symbol.hpp"

#include <utility>

namespace lsysgen {
namespace runtime {

/*
 * The sequence of generations of a grammar, computed one step at a time.
 *
 * Nothing is cached: every step draws fresh choices from the random source,
 * so the generations returned by current() are values the caller may copy
 * and keep. The engine, grammar and random source must outlive the
 * derivation.
 */
class Derivation {
private:
  const Engine& engine_;
  const Grammar& grammar_;
  util::RandomSource& random_;
  Generation current_;
  int index_{0};

public:
  Derivation(const Engine& engine, const Grammar& grammar, util::RandomSource& random)
      : Derivation(engine, grammar, random, grammar.axiom()) { }

  // Starts from an arbitrary generation instead of the axiom.
  Derivation(const Engine& engine, const Grammar& grammar, util::RandomSource& random, const Generation& start)
      : engine_(engine), grammar_(grammar), random_(random), current_(start) { }

  Derivation(const Derivation& other) = delete;
  Derivation& operator=(const Derivation& other) = delete;
  Derivation(Derivation&& other) = delete;
  Derivation& operator=(Derivation&& other) = delete;
  ~Derivation() = default;

  const Generation& current() const noexcept { return current_; }

  // Number of expansion steps done so far.
  int index() const noexcept { return index_; }

  // Computes the next generation. Returns false if the step left the
  // generation unchanged.
  bool next() {
    ++index_;
    engine_._enter_generation(index_, current_);
    Generation result = engine_.expand(current_, grammar_, random_);
    engine_._exit_generation(index_, result);

    bool changed = result != current_;
    current_ = std::move(result);
    return changed;
  }

  // Exactly `steps` more expansions, fixed points included.
  const Generation& run(int steps) {
    for (int i = 0; i < steps; ++i) {
      next();
    }
    return current_;
  }

  // Expands until a step changes nothing, but at most `max_steps` times.
  const Generation& realize(int max_steps) {
    for (int i = 0; i < max_steps; ++i) {
      if (!next()) {
        LSYSGEN_LOG_DEBUG("fixed point reached at generation {}", index_);
        return current_;
      }
    }
    LSYSGEN_LOG_INFO("no fixed point within {} generation(s)", max_steps);
    return current_;
  }
};

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_DERIVATION_HPP
