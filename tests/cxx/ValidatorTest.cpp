// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <lsysgen/parser.hpp>
#include <lsysgen/runtime/Grammar.hpp>
#include <lsysgen/runtime/Symbol.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace lsysgen::parser;
using namespace lsysgen::runtime;

namespace {

GrammarDraft single_rule_draft(const std::vector<ReplacementCase>& cases) {
  GrammarDraft draft;
  draft.alphabet.add("A");
  draft.axiom = {Symbol::letter("A")};
  draft.rules.emplace("A", Rule("A", cases, 3));
  return draft;
}

ValidationReport report_of(const std::string& src) {
  try {
    parse(src);
  } catch (const ValidationReport& report) {
    return report;
  }
  throw std::runtime_error("no validation errors in: " + src);
}

} // namespace

TEST(ValidatorTest, AllOrNothingWeighting) {
  ValidationReport report = report_of("%A\n@A@\n$A = \"x\":1 | \"y\" ~");
  ASSERT_EQ(report.errors().size(), 1u);
  EXPECT_EQ(report.errors()[0].message(), "inconsistent weighting");
  EXPECT_EQ(report.errors()[0].line(), 3);

  EXPECT_NO_THROW(parse("%A\n@A@\n$A = \"x\":1 | \"y\":2 ~"));
  EXPECT_NO_THROW(parse("%A\n@A@\n$A = \"x\" | \"y\" ~"));
}

TEST(ValidatorTest, InconsistentWeightingWhenFirstCaseIsUnweighted) {
  EXPECT_TRUE(report_of("%A\n@A@\n$A = \"x\" | \"y\":1 ~").contains("inconsistent weighting"));
}

TEST(ValidatorTest, ZeroTotalWeight) {
  ValidationReport report = report_of("%A\n@A@\n$A = \"x\":0 | \"y\":0.0 ~");
  ASSERT_EQ(report.errors().size(), 1u);
  EXPECT_TRUE(report.contains("zero total weight"));

  EXPECT_NO_THROW(parse("%A\n@A@\n$A = \"x\":0 | \"y\":1 ~"));
}

TEST(ValidatorTest, MixedWeightUnits) {
  EXPECT_TRUE(report_of("%A\n@A@\n$A = \"x\":25% | \"y\":3 ~").contains("mixed weight units"));
}

TEST(ValidatorTest, PercentagesOverHundredAreAccepted) {
  Grammar grammar = parse("%A\n@A@\n$A = \"x\":80% | \"y\":80% ~");
  EXPECT_EQ(grammar.find_rule("A")->weights(), (std::vector<double>{0.8, 0.8}));
}

TEST(ValidatorTest, NegativeWeight) {
  GrammarDraft draft = single_rule_draft({ReplacementCase({Symbol::literal("x")}, Weight(-1.0)),
                                          ReplacementCase({Symbol::literal("y")}, Weight(2.0))});
  std::vector<ValidationError> errors = Validator().check(draft);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].message(), "negative weight");
  EXPECT_EQ(errors[0].line(), 3);
}

TEST(ValidatorTest, ErrorsAreAggregated) {
  ValidationReport report = report_of(
      "%A, B, C\n"
      "@A, B, C@\n"
      "$A = \"x\":1 | \"y\" ~\n"
      "$B = \"z\":0 | \"w\":0 ~\n"
      "$C = \"v\":10% | \"u\":1 ~\n");
  ASSERT_EQ(report.errors().size(), 3u);
  EXPECT_TRUE(report.contains("inconsistent weighting"));
  EXPECT_TRUE(report.contains("zero total weight"));
  EXPECT_TRUE(report.contains("mixed weight units"));
  EXPECT_FALSE(report.contains("negative weight"));
  EXPECT_EQ(std::string(report.what()).rfind("3 validation error(s)", 0), 0u);
}

TEST(ValidatorTest, ValidatesConstDraft) {
  GrammarDraft draft = single_rule_draft({ReplacementCase({Symbol::literal("x")})});
  Grammar grammar = Validator().validate(draft);
  EXPECT_EQ(grammar.rules().size(), 1u);
  EXPECT_EQ(draft.rules.size(), 1u);
}

TEST(ValidatorTest, UndeclaredLetterIsInternalError) {
  GrammarDraft draft = single_rule_draft({ReplacementCase({Symbol::letter("Z")})});
  EXPECT_THROW(Validator().validate(draft), std::logic_error);

  GrammarDraft axiom_draft = single_rule_draft({ReplacementCase({Symbol::literal("x")})});
  axiom_draft.axiom.push_back(Symbol::letter("Z"));
  EXPECT_THROW(Validator().check(axiom_draft), std::logic_error);
}

TEST(ValidatorTest, MalformedRulesAreInternalErrors) {
  EXPECT_THROW(Validator().check(single_rule_draft({})), std::logic_error);
  EXPECT_THROW(Validator().check(single_rule_draft({ReplacementCase()})), std::logic_error);

  GrammarDraft misfiled = single_rule_draft({ReplacementCase({Symbol::literal("x")})});
  misfiled.alphabet.add("B");
  misfiled.rules.emplace("B", Rule("A", {ReplacementCase({Symbol::literal("y")})}));
  EXPECT_THROW(Validator().check(misfiled), std::logic_error);

  GrammarDraft unbound = single_rule_draft({ReplacementCase({Symbol::literal("x")})});
  unbound.rules.emplace("Q", Rule("Q", {ReplacementCase({Symbol::literal("y")})}));
  EXPECT_THROW(Validator().check(unbound), std::logic_error);
}
