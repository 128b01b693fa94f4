#include <fstream>
#include <string>
#include <vector>

#include "test_util.hpp"

#include <grammar/grammar_parser.hpp>

using grammar::GrammarParser;
using grammar::RawRule;
using grammar::SymbolTables;

static std::string writeGrammar(const std::string &name,
                                const std::string &contents) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream out(path);
  out << contents;
  return path;
}

class RuleLineTest : public ::testing::Test {
protected:
  SymbolTables symbols{{"a", "b", "id"}, {"S", "A"}, "S"};

  std::vector<RawRule> parse(const std::string &line) {
    return grammar::parseRuleLine(line, 1, "test", this->symbols);
  }

  std::optional<grammar::GrammarExceptionKind>
  errorOf(const std::string &line) {
    return test::grammarErrorOf([&] { this->parse(line); });
  }
};

static std::vector<std::string> bodyOf(const RawRule &rule) {
  std::vector<std::string> body;
  for (const grammar::RawToken &token : rule.body)
    body.push_back(token.text);
  return body;
}

TEST_F(RuleLineTest, SplitsAlternatives) {
  std::vector<RawRule> rules = this->parse("S -> aA | b | epsilon");

  ASSERT_EQ(rules.size(), 3u);
  for (const RawRule &rule : rules)
    EXPECT_EQ(rule.head.text, "S");
  EXPECT_EQ(bodyOf(rules[0]), (std::vector<std::string>{"a", "A"}));
  EXPECT_EQ(bodyOf(rules[1]), (std::vector<std::string>{"b"}));
  EXPECT_EQ(bodyOf(rules[2]), (std::vector<std::string>{"epsilon"}));
}

TEST_F(RuleLineTest, SpacedAndJoinedBodiesAgree) {
  std::vector<RawRule> joined = this->parse("S -> aA");
  std::vector<RawRule> spaced = this->parse("S -> a A");

  ASSERT_EQ(joined.size(), 1u);
  ASSERT_EQ(spaced.size(), 1u);
  EXPECT_EQ(bodyOf(joined[0]), bodyOf(spaced[0]));
}

TEST_F(RuleLineTest, MultiCharacterTerminals) {
  std::vector<RawRule> rules = this->parse("A -> idS | id");

  ASSERT_EQ(rules.size(), 2u);
  EXPECT_EQ(bodyOf(rules[0]), (std::vector<std::string>{"id", "S"}));
  EXPECT_EQ(bodyOf(rules[1]), (std::vector<std::string>{"id"}));
}

TEST_F(RuleLineTest, RecordsPositions) {
  std::vector<RawRule> rules = grammar::parseRuleLine("S -> aA", 4, "g",
                                                      this->symbols);

  ASSERT_EQ(rules.size(), 1u);
  const RawRule &rule = rules[0];
  EXPECT_EQ(rule.source, "g");
  EXPECT_EQ(rule.line, 4u);
  EXPECT_EQ(rule.text, "S -> aA");
  EXPECT_EQ(rule.head.span.start.line, 4u);
  EXPECT_EQ(rule.head.span.start.column, 1u);
  ASSERT_EQ(rule.body.size(), 2u);
  EXPECT_EQ(rule.body[0].span.start.column, 6u);
  EXPECT_EQ(rule.body[1].span.start.column, 7u);
}

TEST_F(RuleLineTest, MultiByteSymbolsTakeOneColumn) {
  std::vector<RawRule> rules = this->parse("S -> ε | aS");

  ASSERT_EQ(rules.size(), 2u);
  ASSERT_EQ(rules[0].body.size(), 1u);
  EXPECT_EQ(rules[0].body[0].span.start.column, 6u);
  EXPECT_EQ(rules[0].body[0].span.end.column, 7u);
  ASSERT_EQ(rules[1].body.size(), 2u);
  EXPECT_EQ(rules[1].body[0].span.start.column, 10u);
  EXPECT_EQ(rules[1].body[1].span.start.column, 11u);
}

TEST(TokenizedRuleTest, LaysOutTheRuleOnOneLine) {
  RawRule rule = RawRule::fromTokens("S", {"a", "A"});

  EXPECT_EQ(rule.text, "S -> a A");
  EXPECT_EQ(rule.line, 1u);
  ASSERT_EQ(rule.body.size(), 2u);
  EXPECT_EQ(rule.body[0].span.start.column, 6u);
  EXPECT_EQ(rule.body[1].span.start.column, 8u);
  EXPECT_EQ(RawRule::fromTokens("A", {}).text, "A ->");
}

TEST_F(RuleLineTest, SkipsBlankAndCommentLines) {
  EXPECT_TRUE(this->parse("").empty());
  EXPECT_TRUE(this->parse("   ").empty());
  EXPECT_TRUE(this->parse("  # S -> a").empty());
}

TEST_F(RuleLineTest, MalformedLines) {
  EXPECT_EQ(this->errorOf("S aA"), grammar::MISSING_ARROW);
  EXPECT_EQ(this->errorOf(" -> a"), grammar::NON_TERMINAL_START_REQUIRED);
  EXPECT_EQ(this->errorOf("S A -> a"), grammar::INVALID_RULE_SHAPE);
  EXPECT_EQ(this->errorOf("S -> a -> A"), grammar::INVALID_RULE_SHAPE);
  EXPECT_EQ(this->errorOf("S -> a | | b"), grammar::EMPTY_PRODUCTION);
  EXPECT_EQ(this->errorOf("S ->"), grammar::EMPTY_PRODUCTION);
}

TEST_F(RuleLineTest, ParseRuleLinesNumbersLines) {
  std::vector<RawRule> rules = grammar::parseRuleLines(
      {"S -> aA", "", "A -> b | epsilon"}, 10, "test", this->symbols);

  ASSERT_EQ(rules.size(), 3u);
  EXPECT_EQ(rules[0].line, 10u);
  EXPECT_EQ(rules[1].line, 12u);
  EXPECT_EQ(rules[2].line, 12u);
}

TEST(GrammarParserTest, ParsesExampleFile) {
  GrammarParser parser(std::string(LINNET_EXAMPLES_DIR) + "/even_as.grammar");
  std::unique_ptr<grammar::GrammarDefinition> definition =
      parser.parseGrammar();

  EXPECT_EQ(definition->symbols.getTerminals(),
            (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(definition->symbols.getNonTerminals(),
            (std::vector<std::string>{"E", "O"}));
  EXPECT_EQ(definition->symbols.getStartSymbol(), "E");
  EXPECT_EQ(definition->rules.size(), 5u);
}

TEST(GrammarParserTest, MissingFile) {
  EXPECT_THROW(GrammarParser("this/file/does/not/exist.grammar"),
               UnableToOpenFileException);
}

TEST(GrammarParserTest, IgnoresCommentsAndCarriageReturns) {
  std::string path =
      writeGrammar("linnet_crlf.grammar", "# ends in b\r\n"
                                          "%terminals a b\r\n"
                                          "%nonterminals S\r\n"
                                          "%start S\r\n"
                                          "\r\n"
                                          "S -> aS | bS | b\r\n");

  std::unique_ptr<grammar::GrammarDefinition> definition =
      GrammarParser(path).parseGrammar();

  ASSERT_EQ(definition->rules.size(), 3u);
  EXPECT_EQ(definition->rules[2].line, 6u);
  EXPECT_EQ(definition->rules[2].body.back().text, "b");
}

static std::optional<grammar::GrammarExceptionKind>
fileErrorOf(const std::string &name, const std::string &contents) {
  std::string path = writeGrammar(name, contents);
  return test::grammarErrorOf([&] { GrammarParser(path).parseGrammar(); });
}

TEST(GrammarParserTest, DirectiveErrors) {
  EXPECT_EQ(fileErrorOf("linnet_late.grammar", "%terminals a\n"
                                               "%nonterminals S\n"
                                               "S -> a\n"
                                               "%start S\n"),
            grammar::MALFORMED_DIRECTIVE);
  EXPECT_EQ(fileErrorOf("linnet_unknown.grammar", "%terminals a\n"
                                                  "%symbols S\n"),
            grammar::MALFORMED_DIRECTIVE);
  EXPECT_EQ(fileErrorOf("linnet_twice.grammar", "%terminals a\n"
                                                "%nonterminals S A\n"
                                                "%start S\n"
                                                "%start A\n"),
            grammar::MALFORMED_DIRECTIVE);
  EXPECT_EQ(fileErrorOf("linnet_two_starts.grammar", "%terminals a\n"
                                                     "%nonterminals S A\n"
                                                     "%start S A\n"),
            grammar::MALFORMED_DIRECTIVE);
}

TEST(GrammarParserTest, StartSymbolErrors) {
  EXPECT_EQ(fileErrorOf("linnet_no_start.grammar", "%terminals a\n"
                                                   "%nonterminals S\n"
                                                   "S -> a\n"),
            grammar::UNDECLARED_START_SYMBOL);
  EXPECT_EQ(fileErrorOf("linnet_bad_start.grammar", "%terminals a\n"
                                                    "%nonterminals S\n"
                                                    "%start X\n"
                                                    "S -> a\n"),
            grammar::UNDECLARED_START_SYMBOL);
}

TEST(GrammarParserTest, DeclarationErrors) {
  EXPECT_EQ(fileErrorOf("linnet_no_terms.grammar", "%nonterminals S\n"
                                                   "%start S\n"
                                                   "S -> epsilon\n"),
            grammar::EMPTY_SYMBOL_SET);
  EXPECT_EQ(fileErrorOf("linnet_overlap.grammar", "%terminals a S\n"
                                                  "%nonterminals S\n"
                                                  "%start S\n"),
            grammar::OVERLAPPING_SYMBOLS);
}
