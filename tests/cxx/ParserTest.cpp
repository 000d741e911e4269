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

// Parses `src` expecting a ParseError and returns its message.
std::string parse_error(const std::string& src) {
  try {
    Parser(src).parse();
  } catch (const ParseError& e) {
    return e.message();
  }
  return "<no error>";
}

} // namespace

TEST(ParserTest, AlphabetAndAxiomWithoutRules) {
  GrammarDraft draft = Parser("%A,B\n@A,B@\n").parse();
  EXPECT_EQ(draft.alphabet.letters(), (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(draft.axiom, (Generation{Symbol::letter("A"), Symbol::letter("B")}));
  EXPECT_TRUE(draft.rules.empty());
  EXPECT_EQ(draft.alphabet_line, 1);
  EXPECT_EQ(draft.axiom_line, 2);
}

TEST(ParserTest, NounScenario) {
  Grammar grammar = parse("%NOUN, VERB\n@NOUN, \" runs\"@\n$NOUN = \"dog \" | \"cat \" ~\n");

  EXPECT_EQ(grammar.alphabet().letters(), (std::vector<std::string>{"NOUN", "VERB"}));
  EXPECT_EQ(grammar.axiom(), (Generation{Symbol::letter("NOUN"), Symbol::literal(" runs")}));
  ASSERT_EQ(grammar.rules().size(), 1u);

  const Rule* noun = grammar.find_rule("NOUN");
  ASSERT_NE(noun, nullptr);
  ASSERT_EQ(noun->cases.size(), 2u);
  EXPECT_EQ(noun->cases[0].symbols, (std::vector<Symbol>{Symbol::literal("dog ")}));
  EXPECT_EQ(noun->cases[1].symbols, (std::vector<Symbol>{Symbol::literal("cat ")}));
  EXPECT_FALSE(noun->weighted());
  EXPECT_EQ(noun->weights(), (std::vector<double>{1.0, 1.0}));
  EXPECT_EQ(noun->line, 3);
  EXPECT_EQ(grammar.find_rule("VERB"), nullptr);
}

TEST(ParserTest, CaseConcatenatesAdjacentSymbols) {
  GrammarDraft draft = Parser("%A, B\n@A@\n$A = \"(\" A B \")\" | B ~").parse();
  const Rule& rule = draft.rules.at("A");
  ASSERT_EQ(rule.cases.size(), 2u);
  EXPECT_EQ(rule.cases[0].symbols,
            (std::vector<Symbol>{Symbol::literal("("), Symbol::letter("A"), Symbol::letter("B"), Symbol::literal(")")}));
  EXPECT_EQ(rule.cases[1].symbols, (std::vector<Symbol>{Symbol::letter("B")}));
}

TEST(ParserTest, RawWeights) {
  GrammarDraft draft = Parser("%A\n@A@\n$A = \"x\":1 | \"y\":3 | \"z\":0.5 ~").parse();
  const Rule& rule = draft.rules.at("A");
  ASSERT_EQ(rule.cases.size(), 3u);
  EXPECT_TRUE(rule.weighted());
  EXPECT_EQ(rule.cases[0].weight, Weight(1.0));
  EXPECT_EQ(rule.cases[1].weight, Weight(3.0));
  EXPECT_EQ(rule.cases[2].weight, Weight(0.5));
  EXPECT_EQ(rule.weights(), (std::vector<double>{1.0, 3.0, 0.5}));
}

TEST(ParserTest, PercentWeights) {
  GrammarDraft draft = Parser("%A\n@A@\n$A = \"x\":25% | \"y\":75% ~").parse();
  const Rule& rule = draft.rules.at("A");
  EXPECT_EQ(rule.cases[0].weight, Weight(25.0, true));
  EXPECT_EQ(rule.cases[1].weight, Weight(75.0, true));
  EXPECT_DOUBLE_EQ(rule.weights()[0], 0.25);
  EXPECT_DOUBLE_EQ(rule.weights()[1], 0.75);
}

TEST(ParserTest, FreeLayout) {
  GrammarDraft draft = Parser("# leading comment\n\n  %  A ,B\n@\n A ,\n \"x\"\n@\n$B\n=\n\"y\"\n|\nA\n~\n").parse();
  EXPECT_EQ(draft.alphabet.size(), 2u);
  EXPECT_EQ(draft.axiom.size(), 2u);
  EXPECT_EQ(draft.rules.at("B").cases.size(), 2u);
  EXPECT_EQ(draft.rules.at("B").line, 8);
}

TEST(ParserTest, LettersAreCaseSensitive) {
  EXPECT_EQ(parse_error("%A\n@a@"), "unknown letter in axiom");
}

TEST(ParserTest, Errors) {
  EXPECT_EQ(parse_error(""), "expected alphabet declaration");
  EXPECT_EQ(parse_error("# only a comment\n"), "expected alphabet declaration");
  EXPECT_EQ(parse_error("@A@"), "expected alphabet declaration");
  EXPECT_EQ(parse_error("%"), "expected letter name");
  EXPECT_EQ(parse_error("%A,\n@A@"), "expected letter name");
  EXPECT_EQ(parse_error("%A, B, A\n@A@"), "duplicate letter");
  EXPECT_EQ(parse_error("%A\n$A = \"x\" ~"), "expected axiom declaration");
  EXPECT_EQ(parse_error("%A"), "expected axiom declaration");
  EXPECT_EQ(parse_error("%A\n@@"), "empty axiom");
  EXPECT_EQ(parse_error("%A\n@A,@"), "expected axiom item");
  EXPECT_EQ(parse_error("%A\n@A"), "unterminated axiom");
  EXPECT_EQ(parse_error("%A\n@A,"), "unterminated axiom");
  EXPECT_EQ(parse_error("%A\n@A A@"), "unterminated axiom");
  EXPECT_EQ(parse_error("%A\n@ B @"), "unknown letter in axiom");
}

TEST(ParserTest, RuleErrors) {
  const std::string head = "%A, B\n@A@\n";
  EXPECT_EQ(parse_error(head + "$C = \"x\" ~"), "unknown letter in rule");
  EXPECT_EQ(parse_error(head + "$\"A\" = \"x\" ~"), "expected letter name");
  EXPECT_EQ(parse_error(head + "$A = \"x\" ~\n$A = \"y\" ~"), "duplicate rule for letter");
  EXPECT_EQ(parse_error(head + "$A \"x\" ~"), "expected '=' in rule");
  EXPECT_EQ(parse_error(head + "$A = C ~"), "unknown letter in rule body");
  EXPECT_EQ(parse_error(head + "$A = \"x\": ~"), "expected weight");
  EXPECT_EQ(parse_error(head + "$A = \"x\":y ~"), "expected weight");
  EXPECT_EQ(parse_error(head + "$A = | \"x\" ~"), "empty replacement case");
  EXPECT_EQ(parse_error(head + "$A = \"x\" | ~"), "empty replacement case");
  EXPECT_EQ(parse_error(head + "$A = :2 ~"), "empty replacement case");
  EXPECT_EQ(parse_error(head + "$A = \"x\""), "unterminated rule");
  EXPECT_EQ(parse_error(head + "$A = \"x\" |"), "unterminated rule");
  EXPECT_EQ(parse_error(head + "$A = \"x\" , \"y\" ~"), "unterminated rule");
  EXPECT_EQ(parse_error(head + "A"), "unexpected trailing content");
  EXPECT_EQ(parse_error(head + "$A = \"x\" ~ ~"), "unexpected trailing content");
  EXPECT_EQ(parse_error(head + "%B"), "unexpected trailing content");
}

TEST(ParserTest, ErrorLine) {
  try {
    Parser("%A\n@A@\n\n$A = \"x\"\n  | C ~").parse();
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.line(), 5);
    EXPECT_STREQ(e.what(), "line 5: unknown letter in rule body");
  }
}

TEST(ParserTest, LexErrorsPropagate) {
  EXPECT_THROW(Parser("%A\n@\"x@").parse(), LexError);
  EXPECT_THROW(parse("%A\n@A@\n$A = \"x\" & ~"), LexError);
}

TEST(ParserTest, ErrorsShareBase) {
  EXPECT_THROW(parse("%A\n@B@"), Error);
  EXPECT_THROW(parse("%A\n@B@"), std::runtime_error);
}

TEST(ParserTest, WeightOutOfRange) {
  const std::string head = "%A\n@A@\n$A = \"x\":";
  EXPECT_EQ(parse_error(head + std::string(400, '9') + " ~"), "invalid weight");
  EXPECT_EQ(parse_error(head + "0." + std::string(400, '0') + "1 ~"), "invalid weight");
  EXPECT_EQ(parse_error(head + std::string(400, '9') + "% ~"), "invalid weight");
}

TEST(ParserTest, LongButRepresentableWeights) {
  GrammarDraft draft = Parser("%A\n@A@\n$A = \"x\":0.000 | \"y\":000012.50000 ~").parse();
  const Rule& rule = draft.rules.at("A");
  EXPECT_EQ(rule.cases[0].weight, Weight(0.0));
  EXPECT_EQ(rule.cases[1].weight, Weight(12.5));
}

TEST(ParserTest, WeightErrorLine) {
  try {
    Parser("%A\n@A@\n$A = \"x\":\n" + std::string(400, '9') + " ~").parse();
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.message(), "invalid weight");
    EXPECT_EQ(e.line(), 4);
  }
}
