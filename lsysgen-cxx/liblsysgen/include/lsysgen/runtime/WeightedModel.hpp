// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_WEIGHTEDMODEL_HPP
#define LSYSGEN_RUNTIME_WEIGHTEDMODEL_HPP

#include "Model.hpp"

#include <map>
#include <string>
#include <utility>

namespace lsysgen {
namespace runtime {

/*
 * Custom model (or model wrapper) that pre-multiplies the weights of
 * the cases of a rule before calling the underlying model. Cases without
 * an entry keep their weight.
 */
class WeightedModel : public Model {
public:
  using WeightMapKey = std::pair<std::string, size_t>;  // letter, case index
  using WeightMap = std::map<WeightMapKey, double>;

private:
  Model* model;
  const WeightMap& weights;

public:
  explicit WeightedModel(Model* model, const WeightMap& weights) noexcept : Model(), model(model), weights(weights) {}
  WeightedModel(const WeightedModel& other) = delete;
  WeightedModel& operator=(const WeightedModel& other) = delete;
  WeightedModel(WeightedModel&& other) = delete;
  WeightedModel& operator=(WeightedModel&& other) = delete;
  ~WeightedModel() override { delete model; }

  int choice(const Rule* rule, const std::vector<double>& cweights, util::RandomSource& random) override {
    std::vector<double> multiplied_weights(cweights.size());
    for (size_t i = 0; i < cweights.size(); ++i) {
      auto it = weights.find(WeightMapKey(rule->letter, i));
      multiplied_weights[i] = cweights[i] * (it != weights.end() ? it->second : 1.0);
    }
    return model->choice(rule, multiplied_weights, random);
  }
};

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_WEIGHTEDMODEL_HPP
