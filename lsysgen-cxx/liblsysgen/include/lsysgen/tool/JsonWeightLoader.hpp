// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_TOOL_JSONWEIGHTLOADER_HPP
#define LSYSGEN_TOOL_JSONWEIGHTLOADER_HPP

#include "../runtime/WeightedModel.hpp"
#include "../util/print.hpp"

#include <charconv>
#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace lsysgen {
namespace tool {

/*
 * Reads per-case weight multipliers for WeightedModel from JSON:
 *
 *   {"NOUN": {"0": 2.0, "1": 0.5}, "VERB": {"2": 0}}
 *
 * Keys of the inner objects are case indices in declaration order.
 */
class JsonWeightLoader {
public:
  JsonWeightLoader() = default;
  JsonWeightLoader(const JsonWeightLoader& other) = delete;
  JsonWeightLoader& operator=(const JsonWeightLoader& other) = delete;
  JsonWeightLoader(JsonWeightLoader&& other) = delete;
  JsonWeightLoader& operator=(JsonWeightLoader&& other) = delete;

  bool load(const std::string& fn, runtime::WeightedModel::WeightMap& weights) const {
    std::ifstream wf(fn);
    if (!wf) {
      util::perrf("Failed to open the weights JSON file for reading: {}", fn);
      return false;
    }

    nlohmann::json data = nlohmann::json::parse(wf, nullptr, false);
    if (data.is_discarded()) {
      util::perrf("Invalid JSON in weights file: {}", fn);
      return false;
    }
    return load(data, weights, fn);
  }

  bool load(const nlohmann::json& data, runtime::WeightedModel::WeightMap& weights, const std::string& source = "<json>") const {
    if (!data.is_object()) {
      util::perrf("Weights in {} must be an object keyed by letter", source);
      return false;
    }
    for (auto& [letter, cases] : data.items()) {
      if (!cases.is_object()) {
        util::perrf("Weights of {} in {} must be an object keyed by case index", letter, source);
        return false;
      }
      for (auto& [case_idx, w] : cases.items()) {
        size_t idx = 0;
        auto [ptr, ec] = std::from_chars(case_idx.data(), case_idx.data() + case_idx.size(), idx);
        if (ec != std::errc() || ptr != case_idx.data() + case_idx.size()) {
          util::perrf("Invalid case index '{}' of {} in {}", case_idx, letter, source);
          return false;
        }
        if (!w.is_number() || w.get<double>() < 0) {
          util::perrf("Invalid weight for case '{}' of {} in {}", case_idx, letter, source);
          return false;
        }
        weights[{letter, idx}] = w.get<double>();
      }
    }
    return true;
  }
};

} // namespace tool
} // namespace lsysgen

#endif // LSYSGEN_TOOL_JSONWEIGHTLOADER_HPP
