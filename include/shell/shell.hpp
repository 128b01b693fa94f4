#ifndef __LINNET_SHELL__
#define __LINNET_SHELL__

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>

#include <grammar/grammar_parser.hpp>
#include <grammar/symbols.hpp>
#include <nfa/nfa.hpp>
#include <nfa/simulator.hpp>

namespace shell {

struct Options {
  std::optional<std::string> grammar_file;
  std::optional<std::string> draw_file;
  bool trace = false;
  bool print = false;
  bool help = false;
};

// Returns `std::nullopt` on an unknown flag or a missing flag argument
std::optional<Options> parseArguments(int argc, char **argv);
void printUsage(std::ostream &, const char *program);

// Asks for the symbol declarations and rule lines, one prompt at a time.
// Rule input ends with an empty line or end of input.
std::unique_ptr<grammar::GrammarDefinition> promptGrammar(std::istream &,
                                                          std::ostream &);

std::string setToString(const std::set<std::string> &);
void printDefinition(std::ostream &, const grammar::SymbolTables &);
void printAutomatonSummary(std::ostream &, const nfa::Automaton &);

// Simulates `input` and prints the verdict, and every frontier when
// `trace` is set. Symbols outside the alphabet are named in the verdict.
bool reportString(std::ostream &, const std::string &input,
                  const nfa::Recognizer &, bool trace);
// Reads strings one per line until end of input and reports each
void checkStrings(std::istream &, std::ostream &, const nfa::Recognizer &,
                  bool trace);

} // namespace shell

#endif
