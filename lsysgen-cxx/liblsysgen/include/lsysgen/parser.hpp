// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_PARSER_HPP
#define LSYSGEN_PARSER_HPP

#include "parser/Errors.hpp"
#include "parser/Lexer.hpp"
#include "parser/Parser.hpp"
#include "parser/Token.hpp"
#include "parser/Validator.hpp"

#include <string_view>

namespace lsysgen {
namespace parser {

// Lexes, parses and validates LSYS source in one go.
inline runtime::Grammar parse(std::string_view src) {
  return Validator().validate(Parser(src).parse());
}

} // namespace parser
} // namespace lsysgen

#endif // LSYSGEN_PARSER_HPP
