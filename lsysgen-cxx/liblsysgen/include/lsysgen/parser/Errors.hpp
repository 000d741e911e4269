// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_PARSER_ERRORS_HPP
#define LSYSGEN_PARSER_ERRORS_HPP

#include <format>
#include <stdexcept>
#include <string>
#include <vector>

namespace lsysgen {
namespace parser {

// Base of every user-facing grammar error. The line is 1-based, 0 if unknown.
class Error : public std::runtime_error {
private:
  std::string message_;
  int line_;

public:
  Error(const std::string& message, int line)
      : std::runtime_error(line > 0 ? std::format("line {}: {}", line, message) : message),
        message_(message), line_(line) { }

  const std::string& message() const noexcept { return message_; }
  int line() const noexcept { return line_; }
};

class LexError : public Error {
public:
  using Error::Error;
};

class ParseError : public Error {
public:
  using Error::Error;
};

class ValidationError : public Error {
public:
  using Error::Error;
};

// Every ValidationError found in one grammar.
class ValidationReport : public std::runtime_error {
private:
  std::vector<ValidationError> errors_;

  static std::string summarize(const std::vector<ValidationError>& errors) {
    std::string s = std::format("{} validation error(s)", errors.size());
    for (const ValidationError& e : errors) {
      s += "\n  ";
      s += e.what();
    }
    return s;
  }

public:
  explicit ValidationReport(const std::vector<ValidationError>& errors)
      : std::runtime_error(summarize(errors)), errors_(errors) { }

  const std::vector<ValidationError>& errors() const noexcept { return errors_; }

  bool contains(const std::string& message) const {
    for (const ValidationError& e : errors_) {
      if (e.message() == message) {
        return true;
      }
    }
    return false;
  }
};

} // namespace parser
} // namespace lsysgen

#endif // LSYSGEN_PARSER_ERRORS_HPP
