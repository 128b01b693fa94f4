#ifndef __LINNET_NFA_CLOSURE__
#define __LINNET_NFA_CLOSURE__

#include <unordered_map>

#include "nfa.hpp"

namespace nfa {

// The epsilon-closure of every state of an automaton, computed once up
// front. Later lookups never walk the automaton again.
class ClosureTable {
public:
  ClosureTable(const Automaton &);

  const StateSet &getClosure(State) const;
  // Union of the closures of every state in the set
  StateSet getClosure(const StateSet &) const;

  void printClosures(const Automaton &) const;

  bool operator==(const ClosureTable &other) const {
    return this->closures == other.closures;
  }

private:
  std::unordered_map<State, StateSet, boost::hash<State>> closures;

  void computeClosure(const Automaton &, State);
};

} // namespace nfa

#endif
