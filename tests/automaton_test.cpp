#include <stdexcept>
#include <string>
#include <vector>

#include "test_util.hpp"

#include <grammar/rule.hpp>
#include <nfa/nfa.hpp>

using grammar::SymbolTables;
using nfa::ACCEPT_STATE;
using nfa::Automaton;
using nfa::EPSILON_LABEL;
using nfa::StateSet;

static Automaton buildFromLines(const std::vector<std::string> &lines,
                                const SymbolTables &symbols) {
  return nfa::buildAutomaton(
      symbols,
      grammar::validateRules(test::rulesFromLines(lines, symbols), symbols));
}

TEST(AutomatonTest, OneStatePerNonTerminalPlusAccept) {
  SymbolTables symbols({"a", "b"}, {"S", "A", "B"}, "S");
  Automaton automaton = buildFromLines({"S -> aA", "A -> b"}, symbols);

  EXPECT_EQ(automaton.getStates().size(), 4u);
  EXPECT_TRUE(automaton.hasState(test::stateOf(symbols, "B")));
  EXPECT_TRUE(automaton.hasState(ACCEPT_STATE));
  EXPECT_EQ(automaton.getStartState(), test::stateOf(symbols, "S"));
  EXPECT_EQ(automaton.getAcceptStates(), StateSet{ACCEPT_STATE});
  EXPECT_TRUE(automaton.isAccepting(ACCEPT_STATE));
  EXPECT_FALSE(automaton.isAccepting(test::stateOf(symbols, "S")));
}

TEST(AutomatonTest, TransitionPerRuleKind) {
  SymbolTables symbols({"a", "b"}, {"S", "A"}, "S");
  Automaton automaton =
      buildFromLines({"S -> aA | epsilon", "A -> b"}, symbols);

  nfa::Label a = nfa::symbolLabel(symbols.getTerminalId("a").value());
  nfa::Label b = nfa::symbolLabel(symbols.getTerminalId("b").value());
  nfa::State s = test::stateOf(symbols, "S");
  nfa::State target = test::stateOf(symbols, "A");

  EXPECT_EQ(automaton.getTransitions(s, a), StateSet{target});
  EXPECT_EQ(automaton.getTransitions(s, EPSILON_LABEL), StateSet{ACCEPT_STATE});
  EXPECT_EQ(automaton.getTransitions(target, b), StateSet{ACCEPT_STATE});
  EXPECT_TRUE(automaton.getTransitions(target, a).empty());
  EXPECT_TRUE(automaton.getTransitions(ACCEPT_STATE, a).empty());
  EXPECT_EQ(automaton.getTransitionRelation().size(), 3u);
}

TEST(AutomatonTest, SharedKeysAreUnited) {
  SymbolTables symbols({"a"}, {"S", "A"}, "S");
  Automaton automaton = buildFromLines({"S -> aA | aS | a"}, symbols);

  nfa::Label a = nfa::symbolLabel(symbols.getTerminalId("a").value());
  EXPECT_EQ(automaton.getTransitions(test::stateOf(symbols, "S"), a),
            (StateSet{test::stateOf(symbols, "S"),
                      test::stateOf(symbols, "A"), ACCEPT_STATE}));
  EXPECT_EQ(automaton.getTransitionRelation().size(), 1u);
}

TEST(AutomatonTest, DuplicateRulesAreIdempotent) {
  SymbolTables symbols({"a"}, {"S"}, "S");

  EXPECT_EQ(buildFromLines({"S -> aS | a"}, symbols),
            buildFromLines({"S -> aS | a", "S -> a", "S -> aS"}, symbols));
}

TEST(AutomatonTest, RuleOrderDoesNotMatter) {
  SymbolTables symbols({"a", "b"}, {"S", "A"}, "S");

  EXPECT_EQ(buildFromLines({"S -> aA", "A -> b | epsilon"}, symbols),
            buildFromLines({"A -> epsilon", "A -> b", "S -> aA"}, symbols));
}

TEST(AutomatonTest, EmptyGrammar) {
  SymbolTables symbols({"a"}, {"S"}, "S");

  EXPECT_EQ(test::grammarErrorOf([&] { nfa::buildAutomaton(symbols, {}); }),
            grammar::EMPTY_GRAMMAR);
}

TEST(AutomatonTest, StartSymbolMustBeANonTerminal) {
  SymbolTables symbols({"a"}, {"S"}, "X");
  std::vector<grammar::Rule> rules = grammar::validateRules(
      {grammar::RawRule::fromTokens("S", {"a"})}, symbols);

  EXPECT_EQ(test::grammarErrorOf([&] { nfa::buildAutomaton(symbols, rules); }),
            grammar::UNDECLARED_START_SYMBOL);
}

TEST(AutomatonTest, AddTransitionChecksMembership) {
  SymbolTables symbols({"a"}, {"S"}, "S");
  Automaton automaton(symbols, 0);

  EXPECT_THROW(automaton.addTransition(nfa::nonTerminalState(1), EPSILON_LABEL,
                                       ACCEPT_STATE),
               std::invalid_argument);
  EXPECT_THROW(automaton.addTransition(nfa::nonTerminalState(0),
                                       nfa::symbolLabel(1), ACCEPT_STATE),
               std::invalid_argument);
  EXPECT_THROW(automaton.addTransition(nfa::nonTerminalState(0), EPSILON_LABEL,
                                       nfa::State{nfa::ACCEPTING, 3}),
               std::invalid_argument);
  EXPECT_THROW(Automaton(symbols, 2), std::invalid_argument);
}

TEST(AutomatonTest, StateAndLabelNames) {
  SymbolTables symbols({"a"}, {"S"}, "S");
  Automaton automaton(symbols, 0);

  EXPECT_EQ(automaton.getStateString(nfa::nonTerminalState(0)), "S");
  EXPECT_EQ(automaton.getStateString(ACCEPT_STATE), "ACCEPT");
  EXPECT_EQ(automaton.getLabelString(EPSILON_LABEL), "ε");
  EXPECT_EQ(automaton.getLabelString(nfa::symbolLabel(0)), "a");
}
