#ifndef __LINNET_GRAMMAR_PARSER__
#define __LINNET_GRAMMAR_PARSER__

#include <cstddef>
#include <fstream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "rule.hpp"
#include "symbols.hpp"
#include <LinnetUtil/LinnetUtil.hpp>

namespace grammar {

struct GrammarDefinition {
  SymbolTables symbols;
  std::vector<RawRule> rules;
};

// Splits a rule line such as `S -> aA | b` into one raw rule per
// alternative. Blank lines and `#` comments produce no rules.
std::vector<RawRule> parseRuleLine(const std::string &line,
                                   std::size_t line_number,
                                   const std::string &source,
                                   const SymbolTables &symbols);
std::vector<RawRule> parseRuleLines(const std::vector<std::string> &lines,
                                    std::size_t first_line,
                                    const std::string &source,
                                    const SymbolTables &symbols);

// Reads a grammar file:
//   %terminals a b
//   %nonterminals S A
//   %start S
//   S -> aA | b
class GrammarParser {
private:
  std::string file_name;
  std::ifstream grammar_fs;
  Position pos;
  std::string curr_line;

  std::set<std::string> terminals;
  std::set<std::string> nonterminals;
  std::optional<std::string> start_symbol;
  std::pair<std::size_t, std::string> start_line;
  std::vector<std::pair<std::size_t, std::string>> rule_lines;

  bool nextLine();
  bool isDirective() const;
  void parseDirective();
  std::set<std::string> parseSymbolList(std::size_t offset) const;

public:
  GrammarParser(std::string file_name);
  std::unique_ptr<GrammarDefinition> parseGrammar();
};

} // namespace grammar

#endif
