// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_LISTENER_HPP
#define LSYSGEN_RUNTIME_LISTENER_HPP

#include "Grammar.hpp"
#include "Symbol.hpp"

namespace lsysgen {
namespace runtime {

class Listener {
public:
  Listener() = default;
  Listener(const Listener& other) = delete;
  Listener& operator=(const Listener& other) = delete;
  Listener(Listener&& other) = delete;
  Listener& operator=(Listener&& other) = delete;
  virtual ~Listener() = default;

  // `index` is the number of the generation being computed (1 for the
  // first expansion of the axiom).
  virtual void enter_generation(int index, const Generation& source) {}
  virtual void exit_generation(int index, const Generation& result) {}

  // A letter was replaced by case `choice` of `rule`.
  virtual void rewrite(const Rule* rule, int choice) {}
};

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_LISTENER_HPP
