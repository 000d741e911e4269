// Copyright (c) 2025-2026 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_MODEL_HPP
#define LSYSGEN_RUNTIME_MODEL_HPP

#include "../util/random.hpp"
#include "Grammar.hpp"

#include <vector>

namespace lsysgen {
namespace runtime {

/*
 * Decides which case of a rule replaces a letter. The engine passes one
 * weight per case (1 for every case of an unweighted rule) and expects the
 * index of the chosen case.
 */
class Model {
public:
  Model() = default;
  Model(const Model& other) = delete;
  Model& operator=(const Model& other) = delete;
  Model(Model&& other) = delete;
  Model& operator=(Model&& other) = delete;
  virtual ~Model() = default;

  virtual int choice(const Rule* rule, const std::vector<double>& weights, util::RandomSource& random) = 0;
};

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_MODEL_HPP
