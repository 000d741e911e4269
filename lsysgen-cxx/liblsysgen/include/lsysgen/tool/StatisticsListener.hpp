// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_TOOL_STATISTICSLISTENER_HPP
#define LSYSGEN_TOOL_STATISTICSLISTENER_HPP

#include "../runtime/Grammar.hpp"
#include "../runtime/Listener.hpp"

#include <format>
#include <map>
#include <string>
#include <utility>

namespace lsysgen {
namespace tool {

// Counts how often each case of each rule was chosen and how long the
// generations grew.
class StatisticsListener : public runtime::Listener {
private:
  std::map<std::pair<std::string, int>, size_t> choices_;
  size_t generations_{0};
  size_t longest_{0};

public:
  StatisticsListener() = default;
  ~StatisticsListener() override = default;

  void exit_generation(int index, const runtime::Generation& result) override {
    generations_++;
    if (result.size() > longest_) {
      longest_ = result.size();
    }
  }

  void rewrite(const runtime::Rule* rule, int choice) override {
    choices_[{rule->letter, choice}]++;
  }

  size_t count(const std::string& letter, int choice) const {
    auto it = choices_.find({letter, choice});
    return it != choices_.end() ? it->second : 0;
  }

  size_t generations() const noexcept { return generations_; }
  size_t longest() const noexcept { return longest_; }

  std::string format() const {
    std::string s = std::format("{} generation(s), longest has {} symbol(s)", generations_, longest_);
    for (const auto& [key, n] : choices_) {
      s += std::format("\n  {} case {}: {}", key.first, key.second, n);
    }
    return s;
  }
};

} // namespace tool
} // namespace lsysgen

#endif // LSYSGEN_TOOL_STATISTICSLISTENER_HPP
