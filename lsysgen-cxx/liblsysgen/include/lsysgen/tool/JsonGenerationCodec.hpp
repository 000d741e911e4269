// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_TOOL_JSONGENERATIONCODEC_HPP
#define LSYSGEN_TOOL_JSONGENERATIONCODEC_HPP

#include "../runtime/Symbol.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace lsysgen {
namespace tool {

// A generation as a JSON array of {"t": "l" | "s", "v": text} objects,
// "l" standing for letters and "s" for literal strings.
class JsonGenerationCodec {
public:
  JsonGenerationCodec() = default;
  JsonGenerationCodec(const JsonGenerationCodec& other) = delete;
  JsonGenerationCodec& operator=(const JsonGenerationCodec& other) = delete;
  JsonGenerationCodec(JsonGenerationCodec&& other) = delete;
  JsonGenerationCodec& operator=(JsonGenerationCodec&& other) = delete;
  ~JsonGenerationCodec() = default;

  std::string encode(const runtime::Generation& generation) const {
    return toJson(generation).dump(-1, ' ', true, nlohmann::detail::error_handler_t::ignore);
  }

  // Returns false (leaving `generation` untouched) if `src` is not a
  // well-formed encoded generation.
  bool decode(const std::string& src, runtime::Generation& generation) const {
    auto jsonObj = nlohmann::json::parse(src, nullptr, false);
    if (jsonObj.is_discarded() || !jsonObj.is_array()) {
      return false;
    }
    runtime::Generation result;
    for (const auto& item : jsonObj) {
      if (!item.is_object() || !item.contains("t") || !item.contains("v") || !item["v"].is_string()) {
        return false;
      }
      if (item["t"] == "l") {
        result.push_back(runtime::Symbol::letter(item["v"].get<std::string>()));
      } else if (item["t"] == "s") {
        result.push_back(runtime::Symbol::literal(item["v"].get<std::string>()));
      } else {
        return false;
      }
    }
    generation = std::move(result);
    return true;
  }

  // Decodes either one encoded generation or several, one per line, as
  // written when every generation of a derivation is kept. Blank lines are
  // skipped. Returns false (leaving `generations` untouched) if any line is
  // malformed or no generation is found.
  bool decode_lines(const std::string& src, std::vector<runtime::Generation>& generations) const {
    runtime::Generation generation;
    if (decode(src, generation)) {
      generations = {std::move(generation)};
      return true;
    }
    std::vector<runtime::Generation> result;
    std::istringstream lines(src);
    std::string line;
    while (std::getline(lines, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.find_first_not_of(" \t") == std::string::npos) {
        continue;
      }
      if (!decode(line, generation)) {
        return false;
      }
      result.push_back(std::move(generation));
    }
    if (result.empty()) {
      return false;
    }
    generations = std::move(result);
    return true;
  }

private:
  nlohmann::json toJson(const runtime::Generation& generation) const {
    nlohmann::json j = nlohmann::json::array();
    for (const runtime::Symbol& symbol : generation) {
      j.push_back({{"t", symbol.is_letter() ? "l" : "s"}, {"v", symbol.text()}});
    }
    return j;
  }
};

inline std::string JsonSerializer(const runtime::Generation& generation) {
  return JsonGenerationCodec().encode(generation);
}

} // namespace tool
} // namespace lsysgen

#endif  // LSYSGEN_TOOL_JSONGENERATIONCODEC_HPP
