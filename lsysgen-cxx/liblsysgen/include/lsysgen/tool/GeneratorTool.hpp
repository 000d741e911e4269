// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_TOOL_GENERATORTOOL_HPP
#define LSYSGEN_TOOL_GENERATORTOOL_HPP

#include "../runtime/Engine.hpp"
#include "../runtime/Grammar.hpp"
#include "../util/print.hpp"
#include "../util/random.hpp"
#include "Tool.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

namespace lsysgen {
namespace tool {

class GeneratorTool : public Tool {
private:
  std::string out_format;
  int unique_attempts;
  bool dry_run;

public:
  explicit GeneratorTool(const runtime::Grammar& grammar, const runtime::Engine& engine, SerializerFn serializer,
                         const std::string& out_format, int generations = -1, int max_generations = 64,
                         bool all_generations = false, int memo_size = 0, int unique_attempts = 2,
                         bool dry_run = false)
      : Tool(grammar, engine, serializer, generations, max_generations, all_generations, memo_size),
        out_format(out_format), unique_attempts(std::max(unique_attempts, 1)), dry_run(dry_run) {
    if (!out_format.empty() && !dry_run) {
      std::filesystem::path directoryPath = std::filesystem::absolute(std::filesystem::path(out_format).parent_path());

      if (!std::filesystem::exists(directoryPath))
        std::filesystem::create_directories(directoryPath);
    }
  }

  GeneratorTool(const GeneratorTool& other) = delete;
  GeneratorTool& operator=(const GeneratorTool& other) = delete;
  GeneratorTool(GeneratorTool&& other) = delete;
  GeneratorTool& operator=(GeneratorTool&& other) = delete;
  ~GeneratorTool() override = default;

  // Derives one output and writes it to the file named by `out_format` (with
  // "%d" replaced by `index`), or to stdout if the pattern is empty. Returns
  // the file name ("" for stdout or dry runs).
  std::string create_test(int index, util::RandomSource& random) {
    std::string test;
    for (int attempt = 1; attempt <= unique_attempts; ++attempt) {
      test = derive(random);

      if (this->memoize_test(test.data(), test.size())) {
        break;
      }
      util::poutf("output #{}, attempt {}/{}: already generated among the last {} unique outputs", index, attempt, unique_attempts, this->memo.size());
    }

    std::string test_fn;
    if (!dry_run) {
      if (!out_format.empty()) {
        test_fn = out_format;
        size_t pos = test_fn.find("%d");
        if (pos != std::string::npos) {
          test_fn.replace(pos, 2, std::to_string(index));
        }
        std::ofstream file(test_fn);
        file << test;
        file.close();
        if (!file) {
          util::perrf("Failed to write output file {}", test_fn);
        }
      } else {
        util::pout(test);
      }
    }
    return test_fn;
  }
};

} // namespace tool
} // namespace lsysgen

#endif // LSYSGEN_TOOL_GENERATORTOOL_HPP
