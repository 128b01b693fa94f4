#include <optional>
#include <utility>

#include "simulator.hpp"

namespace nfa {

Simulator::Simulator(const Automaton &automaton, const ClosureTable &closures)
    : automaton(automaton), closures(closures) {}

// States reachable from `frontier` by reading `symbol`, closed under
// epsilon transitions. A symbol outside the alphabet reaches nothing.
StateSet Simulator::step(const StateSet &frontier,
                         const std::string &symbol) const {
  std::optional<uint32_t> terminal =
      this->automaton.getSymbols().getTerminalId(symbol);
  if (!terminal.has_value())
    return {};

  StateSet reachable;
  for (const State &state : frontier) {
    const StateSet &next =
        this->automaton.getTransitions(state, symbolLabel(terminal.value()));
    reachable.insert(next.begin(), next.end());
  }

  return this->closures.getClosure(reachable);
}

SimulationResult Simulator::run(const std::vector<std::string> &input) const {
  SimulationResult result = {false, {}};
  result.frontiers.reserve(input.size() + 1);

  StateSet frontier =
      this->closures.getClosure(this->automaton.getStartState());
  result.frontiers.push_back(frontier);

  for (const std::string &symbol : input) {
    // An empty frontier stays empty
    if (!frontier.empty())
      frontier = this->step(frontier, symbol);
    result.frontiers.push_back(frontier);
  }

  for (const State &state : frontier) {
    if (this->automaton.isAccepting(state)) {
      result.accepted = true;
      break;
    }
  }

  return result;
}

bool Simulator::accepts(const std::vector<std::string> &input) const {
  return this->run(input).accepted;
}

Recognizer::Recognizer(Automaton automaton)
    : automaton(std::move(automaton)), closures(this->automaton) {}

SimulationResult
Recognizer::simulate(const std::vector<std::string> &input) const {
  return Simulator(this->automaton, this->closures).run(input);
}

SimulationResult Recognizer::simulate(const std::string &input) const {
  return this->simulate(this->automaton.getSymbols().tokenize(input));
}

bool Recognizer::accepts(const std::vector<std::string> &input) const {
  return this->simulate(input).accepted;
}

bool Recognizer::accepts(const std::string &input) const {
  return this->simulate(input).accepted;
}

const Automaton &Recognizer::getAutomaton() const { return this->automaton; }

const ClosureTable &Recognizer::getClosures() const { return this->closures; }

Recognizer compile(const grammar::SymbolTables &symbols,
                   const std::vector<grammar::RawRule> &raw_rules) {
  std::vector<grammar::Rule> rules = grammar::validateRules(raw_rules, symbols);
  return Recognizer(buildAutomaton(symbols, rules));
}

} // namespace nfa
