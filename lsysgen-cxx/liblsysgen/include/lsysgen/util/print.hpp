// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_UTIL_PRINT_HPP
#define LSYSGEN_UTIL_PRINT_HPP

#include <format>
#include <iostream>
#include <string_view>

namespace lsysgen {
namespace util {

template<typename Arg>
void pout(Arg&& arg) {
  std::cout << arg << std::endl;
}

template<typename... Args>
void poutf(std::string_view fmt, Args&&... args) {
  std::cout << std::vformat(fmt, std::make_format_args(args...)) << std::endl;
}

template<typename Arg>
void perr(Arg&& arg) {
  std::cerr << arg << std::endl;
}

template<typename... Args>
void perrf(std::string_view fmt, Args&&... args) {
  std::cerr << std::vformat(fmt, std::make_format_args(args...)) << std::endl;
}

// Prints a compiler-style diagnostic: "file:line: message", or
// "file: message" when the line is unknown (0).
inline void perr_at(std::string_view file, int line, std::string_view message) {
  if (line > 0) {
    perrf("{}:{}: {}", file, line, message);
  } else {
    perrf("{}: {}", file, message);
  }
}

} // namespace util
} // namespace lsysgen

#endif  // LSYSGEN_UTIL_PRINT_HPP
