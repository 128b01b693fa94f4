#include <iostream>
#include <optional>
#include <vector>

#include "nfa.hpp"
#include <grammar/error.hpp>

namespace nfa {

Automaton buildAutomaton(const grammar::SymbolTables &symbols,
                         const std::vector<grammar::Rule> &rules) {
  if (rules.empty())
    grammar::throwOnDeclaration(grammar::EMPTY_GRAMMAR, "grammar rules",
                                "At least one rule is required.");

  std::optional<uint32_t> start =
      symbols.getNonTerminalId(symbols.getStartSymbol());
  if (!start.has_value())
    grammar::throwOnDeclaration(grammar::UNDECLARED_START_SYMBOL,
                                "symbol declarations",
                                "'" + symbols.getStartSymbol() + "'");

  std::cout << "Building epsilon-NFA from " << rules.size() << " rules"
            << std::endl;

  Automaton automaton(symbols, start.value());

  for (const grammar::Rule &rule : rules) {
    State head = nonTerminalState(rule.head);

    switch (rule.getKind()) {
    case grammar::EPSILON_RULE:
      automaton.addTransition(head, EPSILON_LABEL, ACCEPT_STATE);
      break;
    case grammar::TERMINAL_RULE:
      automaton.addTransition(head, symbolLabel(rule.terminal.value()),
                              ACCEPT_STATE);
      break;
    case grammar::TERMINAL_TARGET_RULE:
      automaton.addTransition(head, symbolLabel(rule.terminal.value()),
                              nonTerminalState(rule.target.value()));
      break;
    }
  }

  return automaton;
}

} // namespace nfa
