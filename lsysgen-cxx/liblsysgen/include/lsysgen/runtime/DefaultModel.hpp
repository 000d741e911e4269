// Copyright (c) 2025-2026 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_DEFAULTMODEL_HPP
#define LSYSGEN_RUNTIME_DEFAULTMODEL_HPP

#include "../util/random.hpp"
#include "Model.hpp"

#include <numeric>

namespace lsysgen {
namespace runtime {

// Roulette wheel selection: the weights are normalized into consecutive
// intervals of [0, 1) in declaration order and a single uniform draw picks
// the interval it falls into.
class DefaultModel : public Model {
public:
  DefaultModel() = default;
  DefaultModel(const DefaultModel& other) = delete;
  DefaultModel& operator=(const DefaultModel& other) = delete;
  DefaultModel(DefaultModel&& other) = delete;
  DefaultModel& operator=(DefaultModel&& other) = delete;
  ~DefaultModel() override = default;

  int choice(const Rule* rule, const std::vector<double>& weights, util::RandomSource& random) override {
    // Calculate the total sum of weights
    double sum = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (sum <= 0) {
      // Return the last alternative if no choice can be made
      return weights.size() - 1;
    }

    double draw = random.random_unit();
    double cumulative = 0.0;
    int last = -1;
    for (size_t i = 0; i < weights.size(); ++i) {
      if (weights[i] <= 0) {
        continue;
      }
      last = i;
      cumulative += weights[i] / sum;
      if (draw < cumulative) {
        return i;
      }
    }
    // Rounding left the draw just above the last boundary.
    return last;
  }
};

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_DEFAULTMODEL_HPP
