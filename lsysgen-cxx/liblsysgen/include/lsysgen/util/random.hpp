// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_UTIL_RANDOM_HPP
#define LSYSGEN_UTIL_RANDOM_HPP

#include <random>

namespace lsysgen {
namespace util {

/*
 * Source of the random draws made during expansion. It is passed around
 * explicitly so that a fixed seed reproduces a whole derivation and
 * concurrent derivations do not share state.
 */
class RandomSource {
public:
  RandomSource() = default;
  RandomSource(const RandomSource& other) = delete;
  RandomSource& operator=(const RandomSource& other) = delete;
  RandomSource(RandomSource&& other) = delete;
  RandomSource& operator=(RandomSource&& other) = delete;
  virtual ~RandomSource() = default;

  // Uniform draw from [0, 1).
  virtual double random_unit() = 0;
};

template<class Engine = std::default_random_engine>
class EngineRandomSource : public RandomSource {
private:
  Engine engine_;
  std::uniform_real_distribution<double> dist_{0.0, 1.0};

public:
  EngineRandomSource() = default;
  explicit EngineRandomSource(typename Engine::result_type seed) : engine_(seed) { }
  ~EngineRandomSource() override = default;

  void seed(typename Engine::result_type seed) {
    engine_.seed(seed);
    dist_.reset();
  }

  double random_unit() override {
    double u = dist_(engine_);
    // uniform_real_distribution may yield the upper bound (LWG 2524).
    return u < 1.0 ? u : 0.0;
  }
};

using DefaultRandomSource = EngineRandomSource<>;

} // namespace util
} // namespace lsysgen

#endif // LSYSGEN_UTIL_RANDOM_HPP
