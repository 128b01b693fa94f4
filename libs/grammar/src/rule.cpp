#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "rule.hpp"

namespace grammar {

// Builds a rule that did not come from a grammar line. The rule is laid out
// as `head -> t1 t2` on a line of its own so diagnostics can quote it.
RawRule RawRule::fromTokens(std::string head, std::vector<std::string> body) {
  RawRule rule;
  unsigned int column = 1;

  auto place = [&column, &rule](std::string text) {
    unsigned int width = static_cast<unsigned int>(countCharacters(text));
    RawToken token = {std::move(text), {{1, column}, {1, column + width}}};
    column += width + 1;
    rule.text += token.text;
    return token;
  };

  rule.head = place(std::move(head));
  rule.text += " ->";
  column += 3; // "-> "
  for (std::string &text : body) {
    rule.text += " ";
    rule.body.push_back(place(std::move(text)));
  }

  rule.source = "rule";
  rule.line = 1;
  return rule;
}

static std::string quote(const std::string &symbol) {
  return "'" + symbol + "'";
}

// Rules are checked in a fixed order so that an ambiguous body always
// resolves the same way:
//   A -> ε, then A -> a B, then A -> a
Rule validateRule(const RawRule &raw, const SymbolTables &symbols) {
  std::optional<uint32_t> head = symbols.getNonTerminalId(raw.head.text);
  if (!head.has_value()) {
    std::string detail = quote(raw.head.text);
    if (symbols.isTerminal(raw.head.text))
      detail += " is a terminal";
    else if (isEpsilon(raw.head.text))
      detail += " is the empty string";
    else
      detail += " was not declared";
    throwOnRule(NON_TERMINAL_START_REQUIRED, raw, raw.head.span, detail);
  }

  const std::vector<RawToken> &body = raw.body;

  if (body.size() == 1 && isEpsilon(body[0].text))
    return Rule{head.value(), std::nullopt, std::nullopt, raw.line};

  for (const RawToken &token : body) {
    if (!symbols.getKind(token.text).has_value() && !isEpsilon(token.text))
      throwOnRule(UNKNOWN_SYMBOL, raw, token.span,
                  quote(token.text) +
                      " is not a declared terminal or non-terminal");
  }

  if (body.size() == 2) {
    std::optional<uint32_t> terminal = symbols.getTerminalId(body[0].text);
    std::optional<uint32_t> target = symbols.getNonTerminalId(body[1].text);

    if (!terminal.has_value())
      throwOnRule(INVALID_RULE_SHAPE, raw, body[0].span,
                  "expected a terminal but found " + quote(body[0].text));
    if (!target.has_value())
      throwOnRule(INVALID_RULE_SHAPE, raw, body[1].span,
                  "expected a non-terminal but found " + quote(body[1].text));

    return Rule{head.value(), terminal, target, raw.line};
  }

  if (body.size() == 1) {
    std::optional<uint32_t> terminal = symbols.getTerminalId(body[0].text);
    if (!terminal.has_value())
      throwOnRule(INVALID_RULE_SHAPE, raw, body[0].span,
                  "expected a terminal but found " + quote(body[0].text));

    return Rule{head.value(), terminal, std::nullopt, raw.line};
  }

  if (body.empty())
    throwOnRule(INVALID_RULE_SHAPE, raw, raw.head.span, "the body is empty");

  Span extra = {body[2].span.start, body.back().span.end};
  throwOnRule(INVALID_RULE_SHAPE, raw, extra,
              "expected at most two symbols but found " +
                  std::to_string(body.size()));
}

std::vector<Rule> validateRules(const std::vector<RawRule> &raw_rules,
                                const SymbolTables &symbols) {
  std::vector<Rule> rules;
  rules.reserve(raw_rules.size());

  for (const RawRule &raw : raw_rules)
    rules.push_back(validateRule(raw, symbols));

  return rules;
}

std::string ruleToString(const Rule &rule, const SymbolTables &symbols) {
  std::string rule_str = symbols.getNonTerminalString(rule.head) + " -> ";

  switch (rule.getKind()) {
  case EPSILON_RULE:
    rule_str += "ε";
    break;
  case TERMINAL_RULE:
    rule_str += symbols.getTerminalString(rule.terminal.value());
    break;
  case TERMINAL_TARGET_RULE:
    rule_str += symbols.getTerminalString(rule.terminal.value());
    rule_str += " ";
    rule_str += symbols.getNonTerminalString(rule.target.value());
    break;
  }

  return rule_str;
}

} // namespace grammar
