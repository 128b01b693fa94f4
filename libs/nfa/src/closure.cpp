#include <iostream>
#include <vector>

#include "closure.hpp"

namespace nfa {

ClosureTable::ClosureTable(const Automaton &automaton) {
  for (const State &state : automaton.getStates())
    this->computeClosure(automaton, state);
}

// Breadth first search over epsilon transitions from `state`. A state is
// queued at most once, so epsilon cycles terminate.
void ClosureTable::computeClosure(const Automaton &automaton, State state) {
  StateSet &closure = this->closures[state];
  closure.insert(state);

  std::vector<State> to_visit = {state};
  std::size_t visiting = 0;

  while (visiting < to_visit.size()) {
    State current = to_visit[visiting];
    visiting++;

    for (const State &next : automaton.getTransitions(current, EPSILON_LABEL)) {
      if (closure.insert(next).second)
        to_visit.push_back(next);
    }
  }
}

const StateSet &ClosureTable::getClosure(State state) const {
  return this->closures.at(state);
}

StateSet ClosureTable::getClosure(const StateSet &states) const {
  StateSet closure;
  for (const State &state : states) {
    const StateSet &state_closure = this->getClosure(state);
    closure.insert(state_closure.begin(), state_closure.end());
  }
  return closure;
}

void ClosureTable::printClosures(const Automaton &automaton) const {
  std::cout << "Epsilon closures:\n";
  for (const State &state : automaton.getStates()) {
    std::cout << "  " << automaton.getStateString(state) << ": {";

    const StateSet &closure = this->getClosure(state);
    for (auto it = closure.begin(); it != closure.end(); it++) {
      if (it != closure.begin())
        std::cout << ", ";
      std::cout << automaton.getStateString(*it);
    }
    std::cout << "}\n";
  }
  std::cout << std::endl;
}

} // namespace nfa
