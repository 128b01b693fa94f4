#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "nfa.hpp"

namespace nfa {

Automaton::Automaton(const grammar::SymbolTables &symbols, uint32_t start)
    : symbols(symbols), start(nonTerminalState(start)),
      accept_states({ACCEPT_STATE}) {
  for (uint32_t nt_id = 0; nt_id < this->symbols.getNonTermsSize(); nt_id++)
    this->states.push_back(nonTerminalState(nt_id));
  this->states.push_back(ACCEPT_STATE);

  if (!this->hasState(this->start))
    throw std::invalid_argument("start state " + std::to_string(start) +
                                " is not a non-terminal of the grammar");
}

void Automaton::addTransition(State from, Label label, State to) {
  if (!this->hasState(from) || !this->hasState(to))
    throw std::invalid_argument("transition between states that are not part "
                                "of the automaton");
  if (label.kind == SYMBOL && label.terminal >= this->symbols.getTermsSize())
    throw std::invalid_argument("transition on terminal " +
                                std::to_string(label.terminal) +
                                " which is not in the alphabet");

  this->transitions[TransitionKey{from, label}].insert(to);
}

const StateSet &Automaton::getTransitions(State from, Label label) const {
  static const StateSet no_states = {};

  if (auto found = this->transitions.find(TransitionKey{from, label});
      found != this->transitions.end())
    return found->second;
  return no_states;
}

const transition_relation &Automaton::getTransitionRelation() const {
  return this->transitions;
}

const std::vector<State> &Automaton::getStates() const { return this->states; }

State Automaton::getStartState() const { return this->start; }

const StateSet &Automaton::getAcceptStates() const {
  return this->accept_states;
}

bool Automaton::isAccepting(State state) const {
  return this->accept_states.count(state) != 0;
}

bool Automaton::hasState(State state) const {
  if (state.kind == ACCEPTING)
    return state.id == 0;
  return state.id < this->symbols.getNonTermsSize();
}

const grammar::SymbolTables &Automaton::getSymbols() const {
  return this->symbols;
}

std::string Automaton::getStateString(State state) const {
  if (state.kind == ACCEPTING)
    return "ACCEPT";
  return this->symbols.getNonTerminalString(state.id);
}

std::string Automaton::getLabelString(Label label) const {
  if (label.kind == EPSILON)
    return "ε";
  return this->symbols.getTerminalString(label.terminal);
}

void Automaton::printAutomaton() const {
  std::cout << "States: {";
  for (size_t i = 0; i < this->states.size(); i++) {
    std::cout << this->getStateString(this->states[i]);
    if (i < this->states.size() - 1)
      std::cout << ", ";
  }
  std::cout << "}\n";

  std::cout << "Alphabet: {";
  const std::vector<std::string> &alphabet = this->symbols.getTerminals();
  for (size_t i = 0; i < alphabet.size(); i++) {
    std::cout << alphabet[i];
    if (i < alphabet.size() - 1)
      std::cout << ", ";
  }
  std::cout << "}\n";

  std::cout << "Start State: " << this->getStateString(this->start) << "\n";
  std::cout << "Accept States: {" << this->getStateString(ACCEPT_STATE)
            << "}\n";

  // Sorted so the output does not depend on hashing
  std::vector<TransitionKey> keys;
  for (const auto &[key, _] : this->transitions)
    keys.push_back(key);
  std::sort(keys.begin(), keys.end());

  std::cout << "Transitions:\n";
  for (const TransitionKey &key : keys) {
    std::cout << "  (" << this->getStateString(key.from) << ", "
              << this->getLabelString(key.label) << ") -> {";

    const StateSet &to = this->transitions.at(key);
    for (auto state = to.begin(); state != to.end(); state++) {
      if (state != to.begin())
        std::cout << ", ";
      std::cout << this->getStateString(*state);
    }
    std::cout << "}\n";
  }
  std::cout << std::endl;
}

} // namespace nfa
