#ifndef __LINNET_NFA_SIMULATOR__
#define __LINNET_NFA_SIMULATOR__

#include <string>
#include <vector>

#include "closure.hpp"
#include "nfa.hpp"
#include <grammar/rule.hpp>
#include <grammar/symbols.hpp>

namespace nfa {

struct SimulationResult {
  bool accepted;
  // frontiers[0] is the closure of the start state, frontiers[i] the
  // frontier after the i-th input symbol
  std::vector<StateSet> frontiers;
};

// Runs input strings through an automaton. Holds no state between runs, so
// one simulator may serve any number of them.
class Simulator {
public:
  Simulator(const Automaton &, const ClosureTable &);

  SimulationResult run(const std::vector<std::string> &input) const;
  bool accepts(const std::vector<std::string> &input) const;

private:
  const Automaton &automaton;
  const ClosureTable &closures;

  StateSet step(const StateSet &frontier, const std::string &symbol) const;
};

// A compiled grammar: the automaton together with its closure table.
class Recognizer {
public:
  Recognizer(Automaton);

  SimulationResult simulate(const std::vector<std::string> &input) const;
  SimulationResult simulate(const std::string &input) const;
  bool accepts(const std::vector<std::string> &input) const;
  bool accepts(const std::string &input) const;

  const Automaton &getAutomaton() const;
  const ClosureTable &getClosures() const;

private:
  Automaton automaton;
  ClosureTable closures;
};

// Validates every rule, builds the automaton and precomputes its closures.
// The first invalid rule aborts with a `grammar::GrammarException`.
Recognizer compile(const grammar::SymbolTables &,
                   const std::vector<grammar::RawRule> &);

} // namespace nfa

#endif
