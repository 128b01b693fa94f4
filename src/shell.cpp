#include "../include/shell/shell.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <grammar/error.hpp>

namespace shell {

static const char *STDIN_SOURCE = "<stdin>";

std::optional<Options> parseArguments(int argc, char **argv) {
  Options options;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-t" || arg == "--trace") {
      options.trace = true;
    } else if (arg == "-p" || arg == "--print") {
      options.print = true;
    } else if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "-d" || arg == "--draw") {
      if (i + 1 >= argc)
        return std::nullopt;
      options.draw_file = argv[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      return std::nullopt;
    } else {
      if (options.grammar_file.has_value())
        return std::nullopt;
      options.grammar_file = arg;
    }
  }

  return options;
}

void printUsage(std::ostream &out, const char *program) {
  out << "usage: " << program
      << " [-t|--trace] [-p|--print] [-d|--draw FILE] [GRAMMAR_FILE]\n"
      << "  -t, --trace       print the frontier after every input symbol\n"
      << "  -p, --print       print the transition relation and closures\n"
      << "  -d, --draw FILE   save the automaton as an SVG graph\n"
      << "Without GRAMMAR_FILE the grammar is read interactively."
      << std::endl;
}

static std::set<std::string> promptSymbols(std::istream &in,
                                           std::ostream &out,
                                           const char *prompt) {
  out << prompt << std::flush;

  std::string line;
  std::getline(in, line);

  std::set<std::string> symbols;
  std::istringstream line_stream(line);
  std::string symbol;
  while (line_stream >> symbol)
    symbols.insert(symbol);

  return symbols;
}

std::unique_ptr<grammar::GrammarDefinition>
promptGrammar(std::istream &in, std::ostream &out) {
  out << "Define the grammar components first." << std::endl;

  std::set<std::string> terminals = promptSymbols(
      in, out, "Enter Terminal symbols (space-separated, e.g., a b 0 1): ");
  if (terminals.empty())
    grammar::throwOnDeclaration(grammar::EMPTY_SYMBOL_SET, STDIN_SOURCE,
                                "at least one terminal symbol must be "
                                "provided");

  std::set<std::string> nonterminals = promptSymbols(
      in, out, "Enter Non-Terminal symbols (space-separated, e.g., S A B): ");
  if (nonterminals.empty())
    grammar::throwOnDeclaration(grammar::EMPTY_SYMBOL_SET, STDIN_SOURCE,
                                "at least one non-terminal symbol must be "
                                "provided");

  std::set<std::string> start = promptSymbols(
      in, out, "Enter the Start Symbol (must be one of the non-terminals): ");
  if (start.size() != 1)
    grammar::throwOnDeclaration(grammar::UNDECLARED_START_SYMBOL, STDIN_SOURCE,
                                "exactly one start symbol must be provided");

  grammar::SymbolTables symbols(terminals, nonterminals, *start.begin());
  if (!symbols.isNonTerminal(symbols.getStartSymbol()))
    grammar::throwOnDeclaration(grammar::UNDECLARED_START_SYMBOL, STDIN_SOURCE,
                                "'" + symbols.getStartSymbol() +
                                    "' is not in the declared non-terminals " +
                                    setToString(nonterminals));

  printDefinition(out, symbols);

  out << "\nEnter grammar rules (one per line, e.g., 'S -> aA | b').\n"
      << "Use 'epsilon' or 'ε' for the empty string production.\n"
      << "Press Enter on an empty line to finish grammar input.\n"
      << "--------------------------------" << std::endl;

  std::vector<std::string> lines;
  std::string line;
  while (true) {
    out << "> " << std::flush;
    if (!std::getline(in, line) || line.empty())
      break;
    lines.push_back(line);
  }

  std::vector<grammar::RawRule> rules =
      grammar::parseRuleLines(lines, 1, STDIN_SOURCE, symbols);

  return std::make_unique<grammar::GrammarDefinition>(
      grammar::GrammarDefinition{std::move(symbols), std::move(rules)});
}

std::string setToString(const std::set<std::string> &symbols) {
  std::string set_str = "{";
  for (auto it = symbols.begin(); it != symbols.end(); it++) {
    if (it != symbols.begin())
      set_str += ", ";
    set_str += *it;
  }
  return set_str + "}";
}

void printDefinition(std::ostream &out, const grammar::SymbolTables &symbols) {
  const std::vector<std::string> &terminals = symbols.getTerminals();
  const std::vector<std::string> &nonterminals = symbols.getNonTerminals();

  out << "\n--- Grammar Definition ---\n"
      << "Terminals (Σ): "
      << setToString({terminals.begin(), terminals.end()}) << "\n"
      << "Non-Terminals (V): "
      << setToString({nonterminals.begin(), nonterminals.end()}) << "\n"
      << "Start Symbol (S): " << symbols.getStartSymbol() << "\n"
      << "--------------------------" << std::endl;
}

static std::string frontierToString(const nfa::Automaton &automaton,
                                    const nfa::StateSet &frontier) {
  std::set<std::string> names;
  for (const nfa::State &state : frontier)
    names.insert(automaton.getStateString(state));
  return setToString(names);
}

void printAutomatonSummary(std::ostream &out,
                           const nfa::Automaton &automaton) {
  std::set<std::string> states;
  for (const nfa::State &state : automaton.getStates())
    states.insert(automaton.getStateString(state));

  const std::vector<std::string> &alphabet =
      automaton.getSymbols().getTerminals();

  out << "\n--- NFA Constructed ---\n"
      << "NFA States: " << setToString(states) << "\n"
      << "NFA Alphabet: " << setToString({alphabet.begin(), alphabet.end()})
      << "\n"
      << "NFA Start State: "
      << automaton.getStateString(automaton.getStartState()) << "\n"
      << "NFA Accept States: "
      << frontierToString(automaton, automaton.getAcceptStates()) << std::endl;
}

bool reportString(std::ostream &out, const std::string &input,
                  const nfa::Recognizer &recognizer, bool trace) {
  const nfa::Automaton &automaton = recognizer.getAutomaton();
  std::vector<std::string> symbols = automaton.getSymbols().tokenize(input);

  std::set<std::string> invalid;
  for (const std::string &symbol : symbols) {
    if (!automaton.getSymbols().isTerminal(symbol))
      invalid.insert(symbol);
  }

  nfa::SimulationResult result = recognizer.simulate(symbols);

  if (trace) {
    out << "  start: " << frontierToString(automaton, result.frontiers[0])
        << "\n";
    for (size_t i = 0; i < symbols.size(); i++) {
      out << "  " << symbols[i] << ": "
          << frontierToString(automaton, result.frontiers[i + 1]) << "\n";
    }
  }

  out << "String '" << input << "': ";
  if (!invalid.empty())
    out << "Rejected (Contains symbols not in alphabet: "
        << setToString(invalid) << ")";
  else
    out << (result.accepted ? "Accepted" : "Rejected");
  out << std::endl;

  return result.accepted;
}

void checkStrings(std::istream &in, std::ostream &out,
                  const nfa::Recognizer &recognizer, bool trace) {
  out << "\n--- String Acceptance Check ---\n"
      << "Enter strings to check (one per line). An empty line checks the "
         "empty string; end input to exit."
      << std::endl;

  std::string input;
  while (true) {
    out << "String? " << std::flush;
    if (!std::getline(in, input))
      break;
    if (!input.empty() && input.back() == '\r')
      input.pop_back();

    reportString(out, input, recognizer, trace);
  }
}

} // namespace shell
