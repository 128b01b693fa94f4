#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <utility>

#include "error.hpp"
#include "symbols.hpp"

namespace grammar {

static const char *DECLARATIONS = "symbol declarations";

bool isEpsilon(const std::string &token) {
  if (token == "ε")
    return true;

  std::string lowered = token;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lowered == "epsilon";
}

// Number of bytes in the UTF-8 sequence starting with `lead`
static std::size_t utf8Length(unsigned char lead) {
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 1;
}

std::size_t countCharacters(const std::string &text) {
  std::size_t count = 0;
  std::size_t offset = 0;
  while (offset < text.length()) {
    offset += utf8Length(text[offset]);
    count++;
  }
  return count;
}

static std::string joinSymbols(const std::set<std::string> &symbols) {
  std::string joined = "{";
  for (const std::string &symbol : symbols) {
    if (joined.length() > 1)
      joined += ", ";
    joined += "'" + symbol + "'";
  }
  return joined + "}";
}

SymbolTables::SymbolTables(const std::set<std::string> &terminals,
                           const std::set<std::string> &nonterminals,
                           std::string start_symbol)
    : start_symbol(std::move(start_symbol)) {
  if (terminals.empty())
    throwOnDeclaration(EMPTY_SYMBOL_SET, DECLARATIONS,
                       "at least one terminal symbol must be declared");
  if (nonterminals.empty())
    throwOnDeclaration(EMPTY_SYMBOL_SET, DECLARATIONS,
                       "at least one non-terminal symbol must be declared");

  std::set<std::string> overlap;
  std::set_intersection(terminals.begin(), terminals.end(),
                        nonterminals.begin(), nonterminals.end(),
                        std::inserter(overlap, overlap.begin()));
  if (!overlap.empty())
    throwOnDeclaration(OVERLAPPING_SYMBOLS, DECLARATIONS,
                       "overlap: " + joinSymbols(overlap));

  for (const std::set<std::string> *symbols : {&terminals, &nonterminals}) {
    for (const std::string &symbol : *symbols) {
      if (symbol.empty() || isEpsilon(symbol))
        throwOnDeclaration(RESERVED_SYMBOL, DECLARATIONS,
                           "'" + symbol + "' cannot be declared as a symbol");
      if (std::any_of(symbol.begin(), symbol.end(),
                      [](unsigned char c) { return std::isspace(c); }))
        throwOnDeclaration(RESERVED_SYMBOL, DECLARATIONS,
                           "'" + symbol + "' contains whitespace");
      this->longest_symbol = std::max(this->longest_symbol, symbol.length());
    }
  }

  // std::set iterates in lexicographic order, which fixes the ids
  for (const std::string &name : terminals) {
    this->term_id_map[name] = this->terminals.size();
    this->terminals.push_back(name);
  }
  for (const std::string &name : nonterminals) {
    this->nonterm_id_map[name] = this->nonterminals.size();
    this->nonterminals.push_back(name);
  }
}

bool SymbolTables::isTerminal(const std::string &name) const {
  return this->term_id_map.find(name) != this->term_id_map.end();
}

bool SymbolTables::isNonTerminal(const std::string &name) const {
  return this->nonterm_id_map.find(name) != this->nonterm_id_map.end();
}

std::optional<TokenKind> SymbolTables::getKind(const std::string &name) const {
  if (this->isTerminal(name))
    return TERM;
  if (this->isNonTerminal(name))
    return NON_TERM;
  return std::nullopt;
}

std::optional<uint32_t>
SymbolTables::getTerminalId(const std::string &name) const {
  if (auto id_index = this->term_id_map.find(name);
      id_index != this->term_id_map.end())
    return id_index->second;
  return std::nullopt;
}

std::optional<uint32_t>
SymbolTables::getNonTerminalId(const std::string &name) const {
  if (auto id_index = this->nonterm_id_map.find(name);
      id_index != this->nonterm_id_map.end())
    return id_index->second;
  return std::nullopt;
}

const std::string &SymbolTables::getTerminalString(uint32_t id) const {
  return this->terminals.at(id);
}

const std::string &SymbolTables::getNonTerminalString(uint32_t id) const {
  return this->nonterminals.at(id);
}

const std::string &SymbolTables::getStartSymbol() const {
  return this->start_symbol;
}

uint32_t SymbolTables::getTermsSize() const { return this->terminals.size(); }

uint32_t SymbolTables::getNonTermsSize() const {
  return this->nonterminals.size();
}

const std::vector<std::string> &SymbolTables::getTerminals() const {
  return this->terminals;
}

const std::vector<std::string> &SymbolTables::getNonTerminals() const {
  return this->nonterminals;
}

std::vector<std::string> SymbolTables::tokenize(const std::string &input,
                                                bool with_nonterminals) const {
  std::vector<std::string> tokens;

  std::size_t offset = 0;
  while (offset < input.length()) {
    std::size_t length = 0;
    std::size_t longest =
        std::min(this->longest_symbol, input.length() - offset);

    for (std::size_t len = longest; len > 0; len--) {
      std::string candidate = input.substr(offset, len);
      if (this->isTerminal(candidate) ||
          (with_nonterminals && this->isNonTerminal(candidate))) {
        length = len;
        break;
      }
    }

    if (length == 0)
      length = std::min(utf8Length(input[offset]), input.length() - offset);

    tokens.push_back(input.substr(offset, length));
    offset += length;
  }

  return tokens;
}

} // namespace grammar
