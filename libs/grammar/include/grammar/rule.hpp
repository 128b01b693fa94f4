#ifndef __LINNET_GRAMMAR_RULE__
#define __LINNET_GRAMMAR_RULE__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "symbols.hpp"
#include <LinnetUtil/LinnetUtil.hpp>

namespace grammar {

// A token as it was written, with the columns it occupied.
struct RawToken {
  std::string text;
  Span span;
};

// line l: S -> a A
// => ({S}, [{a}, {A}], l)
struct RawRule {
  RawToken head;
  std::vector<RawToken> body;
  std::string source;
  std::size_t line;
  std::string text;

  static RawRule fromTokens(std::string head, std::vector<std::string> body);
};

enum RuleKind { EPSILON_RULE, TERMINAL_RULE, TERMINAL_TARGET_RULE };

// A validated right-linear production over interned symbol ids.
//   A -> ε   : no terminal, no target
//   A -> a   : terminal, no target (ends in the accepting state)
//   A -> a B : terminal and target
struct Rule {
  uint32_t head;
  std::optional<uint32_t> terminal;
  std::optional<uint32_t> target;
  std::size_t line;

  RuleKind getKind() const {
    if (!this->terminal.has_value())
      return EPSILON_RULE;
    return this->target.has_value() ? TERMINAL_TARGET_RULE : TERMINAL_RULE;
  }

  bool operator==(const Rule &other) const {
    return this->head == other.head && this->terminal == other.terminal &&
           this->target == other.target;
  }
};

Rule validateRule(const RawRule &, const SymbolTables &);
std::vector<Rule> validateRules(const std::vector<RawRule> &,
                                const SymbolTables &);

std::string ruleToString(const Rule &, const SymbolTables &);

} // namespace grammar

#endif
