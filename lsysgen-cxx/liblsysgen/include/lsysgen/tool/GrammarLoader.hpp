// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_TOOL_GRAMMARLOADER_HPP
#define LSYSGEN_TOOL_GRAMMARLOADER_HPP

#include "../parser.hpp"
#include "../runtime/Grammar.hpp"
#include "../util/log.hpp"
#include "../util/print.hpp"

#include <fstream>
#include <iterator>
#include <string>

namespace lsysgen {
namespace tool {

// Reads and parses an LSYS file. Problems are printed as "file:line: message"
// diagnostics and reported by a null return.
class GrammarLoader {
public:
  GrammarLoader() = default;
  GrammarLoader(const GrammarLoader& other) = delete;
  GrammarLoader& operator=(const GrammarLoader& other) = delete;
  GrammarLoader(GrammarLoader&& other) = delete;
  GrammarLoader& operator=(GrammarLoader&& other) = delete;

  // The caller owns the returned grammar.
  runtime::Grammar* load(const std::string& fn) const {
    std::ifstream gf(fn, std::ios::binary);
    if (!gf) {
      util::perrf("Failed to open grammar file for reading: {}", fn);
      return nullptr;
    }
    std::string src((std::istreambuf_iterator<char>(gf)), std::istreambuf_iterator<char>());
    return load_source(src, fn);
  }

  runtime::Grammar* load_source(const std::string& src, const std::string& name) const {
    try {
      runtime::Grammar* grammar = new runtime::Grammar(parser::parse(src));
      LSYSGEN_LOG_INFO("loaded {}: {} letter(s), {} rule(s)", name, grammar->alphabet().size(), grammar->rules().size());
      return grammar;
    } catch (const parser::ValidationReport& report) {
      for (const parser::ValidationError& e : report.errors()) {
        util::perr_at(name, e.line(), e.message());
      }
    } catch (const parser::Error& e) {
      util::perr_at(name, e.line(), e.message());
    }
    return nullptr;
  }
};

} // namespace tool
} // namespace lsysgen

#endif // LSYSGEN_TOOL_GRAMMARLOADER_HPP
