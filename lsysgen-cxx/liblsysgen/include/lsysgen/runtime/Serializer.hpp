// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_SERIALIZER_HPP
#define LSYSGEN_RUNTIME_SERIALIZER_HPP

#include "Symbol.hpp"

#include <string>

namespace lsysgen {
namespace runtime {

// Literals contribute their text, letters their name.

inline std::string SimpleSpaceSerializer(const Generation& generation) {
  std::string src;
  for (const Symbol& symbol : generation) {
    if (!src.empty()) {
      src += " ";
    }
    src += symbol.text();
  }
  return src;
}

inline std::string NoSpaceSerializer(const Generation& generation) {
  std::string src;
  for (const Symbol& symbol : generation) {
    src += symbol.text();
  }
  return src;
}

inline std::string ReprSerializer(const Generation& generation) {
  return format_generation(generation);
}

} // namespace runtime
} // namespace lsysgen

#endif // LSYSGEN_RUNTIME_SERIALIZER_HPP
