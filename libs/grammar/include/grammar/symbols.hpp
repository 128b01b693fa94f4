#ifndef __LINNET_GRAMMAR_SYMBOLS__
#define __LINNET_GRAMMAR_SYMBOLS__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace grammar {

enum TokenKind { TERM, NON_TERM };

// `epsilon` in any letter case, or `ε`
bool isEpsilon(const std::string &);
// Number of UTF-8 characters in `text`, counting a malformed byte as one
std::size_t countCharacters(const std::string &text);

// The declared alphabet of a grammar.
// Terminals and non-terminals are interned to dense ids in lexicographic
// order of their names, so two tables built from the same declarations
// assign the same ids.
class SymbolTables {
public:
  SymbolTables(const std::set<std::string> &terminals,
               const std::set<std::string> &nonterminals,
               std::string start_symbol);

  bool isTerminal(const std::string &) const;
  bool isNonTerminal(const std::string &) const;
  std::optional<TokenKind> getKind(const std::string &) const;

  std::optional<uint32_t> getTerminalId(const std::string &) const;
  std::optional<uint32_t> getNonTerminalId(const std::string &) const;

  const std::string &getTerminalString(uint32_t) const;
  const std::string &getNonTerminalString(uint32_t) const;
  const std::string &getStartSymbol() const;

  uint32_t getTermsSize() const;
  uint32_t getNonTermsSize() const;

  const std::vector<std::string> &getTerminals() const;
  const std::vector<std::string> &getNonTerminals() const;

  // Splits `input` into symbols by longest match against the declared
  // terminals (and non-terminals, if asked). Anything undeclared is split
  // into single UTF-8 characters.
  std::vector<std::string> tokenize(const std::string &input,
                                    bool with_nonterminals = false) const;

  bool operator==(const SymbolTables &other) const {
    return this->terminals == other.terminals &&
           this->nonterminals == other.nonterminals &&
           this->start_symbol == other.start_symbol;
  }

private:
  std::vector<std::string> terminals;
  std::vector<std::string> nonterminals;
  std::string start_symbol;

  std::unordered_map<std::string, uint32_t> term_id_map;
  std::unordered_map<std::string, uint32_t> nonterm_id_map;

  std::size_t longest_symbol = 0;
};

} // namespace grammar

#endif
