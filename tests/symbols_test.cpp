#include <string>
#include <vector>

#include "test_util.hpp"

using grammar::SymbolTables;

TEST(SymbolTablesTest, InternsSymbolsInLexicographicOrder) {
  SymbolTables symbols({"b", "a"}, {"S", "A"}, "S");

  EXPECT_EQ(symbols.getTermsSize(), 2u);
  EXPECT_EQ(symbols.getNonTermsSize(), 2u);
  EXPECT_EQ(symbols.getTerminalId("a"), 0u);
  EXPECT_EQ(symbols.getTerminalId("b"), 1u);
  EXPECT_EQ(symbols.getNonTerminalId("A"), 0u);
  EXPECT_EQ(symbols.getNonTerminalId("S"), 1u);
  EXPECT_EQ(symbols.getTerminalString(1), "b");
  EXPECT_EQ(symbols.getNonTerminalString(1), "S");
  EXPECT_EQ(symbols.getStartSymbol(), "S");
}

TEST(SymbolTablesTest, ClassifiesSymbols) {
  SymbolTables symbols({"a"}, {"S"}, "S");

  EXPECT_TRUE(symbols.isTerminal("a"));
  EXPECT_FALSE(symbols.isTerminal("S"));
  EXPECT_TRUE(symbols.isNonTerminal("S"));
  EXPECT_EQ(symbols.getKind("a"), grammar::TERM);
  EXPECT_EQ(symbols.getKind("S"), grammar::NON_TERM);
  EXPECT_FALSE(symbols.getKind("c").has_value());
  EXPECT_FALSE(symbols.getTerminalId("S").has_value());
}

TEST(SymbolTablesTest, RejectsEmptySets) {
  EXPECT_EQ(test::grammarErrorOf([] { SymbolTables({}, {"S"}, "S"); }),
            grammar::EMPTY_SYMBOL_SET);
  EXPECT_EQ(test::grammarErrorOf([] { SymbolTables({"a"}, {}, "S"); }),
            grammar::EMPTY_SYMBOL_SET);
}

TEST(SymbolTablesTest, RejectsOverlappingSets) {
  EXPECT_EQ(
      test::grammarErrorOf([] { SymbolTables({"a", "S"}, {"S"}, "S"); }),
      grammar::OVERLAPPING_SYMBOLS);
}

TEST(SymbolTablesTest, RejectsEpsilonAsASymbol) {
  EXPECT_EQ(
      test::grammarErrorOf([] { SymbolTables({"epsilon"}, {"S"}, "S"); }),
      grammar::RESERVED_SYMBOL);
  EXPECT_EQ(test::grammarErrorOf([] { SymbolTables({"a"}, {"ε"}, "ε"); }),
            grammar::RESERVED_SYMBOL);
}

TEST(SymbolTablesTest, StartSymbolIsNotCheckedHere) {
  SymbolTables symbols({"a"}, {"S"}, "X");
  EXPECT_FALSE(symbols.isNonTerminal(symbols.getStartSymbol()));
}

TEST(SymbolTablesTest, EpsilonSpellings) {
  EXPECT_TRUE(grammar::isEpsilon("epsilon"));
  EXPECT_TRUE(grammar::isEpsilon("EPSILON"));
  EXPECT_TRUE(grammar::isEpsilon("Epsilon"));
  EXPECT_TRUE(grammar::isEpsilon("ε"));
  EXPECT_FALSE(grammar::isEpsilon("eps"));
  EXPECT_FALSE(grammar::isEpsilon(""));
}

TEST(SymbolTablesTest, TokenizeSplitsSingleCharacters) {
  SymbolTables symbols({"a", "b"}, {"S"}, "S");

  EXPECT_EQ(symbols.tokenize("abba"),
            (std::vector<std::string>{"a", "b", "b", "a"}));
  EXPECT_EQ(symbols.tokenize("acb"),
            (std::vector<std::string>{"a", "c", "b"}));
  EXPECT_TRUE(symbols.tokenize("").empty());
}

TEST(SymbolTablesTest, TokenizePrefersLongestSymbol) {
  SymbolTables symbols({"a", "ab", "b"}, {"S1"}, "S1");

  EXPECT_EQ(symbols.tokenize("abab"),
            (std::vector<std::string>{"ab", "ab"}));
  EXPECT_EQ(symbols.tokenize("aS1", true),
            (std::vector<std::string>{"a", "S1"}));
  EXPECT_EQ(symbols.tokenize("aS1"),
            (std::vector<std::string>{"a", "S", "1"}));
}

TEST(SymbolTablesTest, TokenizeKeepsMultiByteCharactersWhole) {
  SymbolTables symbols({"a"}, {"S"}, "S");

  EXPECT_EQ(symbols.tokenize("aεa"),
            (std::vector<std::string>{"a", "ε", "a"}));
}

TEST(SymbolTablesTest, TablesFromSameDeclarationsAreEqual) {
  SymbolTables first({"a", "b"}, {"S", "A"}, "S");
  SymbolTables second({"b", "a"}, {"A", "S"}, "S");
  SymbolTables other_start({"a", "b"}, {"S", "A"}, "A");

  EXPECT_TRUE(first == second);
  EXPECT_FALSE(first == other_start);
}
