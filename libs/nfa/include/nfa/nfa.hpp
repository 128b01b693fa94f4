#ifndef __LINNET_NFA__
#define __LINNET_NFA__

#include <boost/container_hash/extensions.hpp>
#include <boost/container_hash/hash_fwd.hpp>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <grammar/rule.hpp>
#include <grammar/symbols.hpp>

namespace nfa {

enum StateKind { NON_TERMINAL, ACCEPTING };

// One state per declared non-terminal, plus the accepting state. The
// accepting state is told apart by its kind, never by a name.
struct State {
  StateKind kind;
  uint32_t id;

  bool operator==(nfa::State const &other) const {
    return this->id == other.id && this->kind == other.kind;
  }
  bool operator!=(nfa::State const &other) const { return !(*this == other); }
  bool operator<(nfa::State const &other) const {
    return this->kind < other.kind ||
           (this->kind == other.kind && this->id < other.id);
  }
};

const State ACCEPT_STATE = {ACCEPTING, 0};

inline State nonTerminalState(uint32_t id) { return State{NON_TERMINAL, id}; }

enum LabelKind { EPSILON, SYMBOL };

struct Label {
  LabelKind kind;
  uint32_t terminal; // id of the terminal when kind is SYMBOL

  bool operator==(nfa::Label const &other) const {
    return this->kind == other.kind &&
           (this->kind == EPSILON || this->terminal == other.terminal);
  }
  bool operator<(nfa::Label const &other) const {
    return this->kind < other.kind ||
           (this->kind == other.kind && this->kind == SYMBOL &&
            this->terminal < other.terminal);
  }
};

const Label EPSILON_LABEL = {EPSILON, 0};

inline Label symbolLabel(uint32_t terminal) { return Label{SYMBOL, terminal}; }

struct TransitionKey {
  State from;
  Label label;

  bool operator==(nfa::TransitionKey const &other) const {
    return this->from == other.from && this->label == other.label;
  }
  bool operator<(nfa::TransitionKey const &other) const {
    return this->from < other.from ||
           (this->from == other.from && this->label < other.label);
  }
};

typedef std::set<State> StateSet;

} // namespace nfa

namespace boost {
template <> struct hash<nfa::State> {
  size_t operator()(const nfa::State &s) const {
    size_t hash = 0;
    boost::hash_combine(hash, s.kind);
    boost::hash_combine(hash, s.id);
    return hash;
  }
};

template <> struct hash<nfa::Label> {
  size_t operator()(const nfa::Label &l) const {
    size_t hash = 0;
    boost::hash_combine(hash, l.kind);
    if (l.kind == nfa::SYMBOL)
      boost::hash_combine(hash, l.terminal);
    return hash;
  }
};

template <> struct hash<nfa::TransitionKey> {
  size_t operator()(const nfa::TransitionKey &k) const {
    size_t hash = 0;
    boost::hash_combine(hash, boost::hash<nfa::State>()(k.from));
    boost::hash_combine(hash, boost::hash<nfa::Label>()(k.label));
    return hash;
  }
};
} // namespace boost

namespace nfa {

typedef std::unordered_map<TransitionKey, StateSet,
                           boost::hash<TransitionKey>>
    transition_relation;

// An epsilon-NFA over the terminals of a grammar.
// States and alphabet come from the symbol tables; transitions are added
// by union, so several destinations may share a (state, label) key.
class Automaton {
public:
  Automaton(const grammar::SymbolTables &symbols, uint32_t start);

  // Throws `std::invalid_argument` if either state or the label is not part
  // of this automaton
  void addTransition(State from, Label label, State to);

  const StateSet &getTransitions(State from, Label label) const;
  const transition_relation &getTransitionRelation() const;

  const std::vector<State> &getStates() const;
  State getStartState() const;
  const StateSet &getAcceptStates() const;
  bool isAccepting(State) const;
  bool hasState(State) const;

  const grammar::SymbolTables &getSymbols() const;
  std::string getStateString(State) const;
  std::string getLabelString(Label) const;

  void printAutomaton() const;

  bool operator==(const Automaton &other) const {
    return this->symbols == other.symbols && this->start == other.start &&
           this->transitions == other.transitions;
  }

private:
  grammar::SymbolTables symbols;
  std::vector<State> states;
  State start;
  StateSet accept_states;
  transition_relation transitions;
};

// Folds validated rules into an automaton:
//   A -> ε   : (A, ε) -> ACCEPT
//   A -> a   : (A, a) -> ACCEPT
//   A -> a B : (A, a) -> B
Automaton buildAutomaton(const grammar::SymbolTables &,
                         const std::vector<grammar::Rule> &);

} // namespace nfa

#endif
