#ifndef __LINNET_GRAMMAR_ERROR__
#define __LINNET_GRAMMAR_ERROR__

#include <cstddef>
#include <string>

#include "rule.hpp"
#include <LinnetUtil/LinnetUtil.hpp>

namespace grammar {

enum GrammarExceptionKind {
  INVALID_RULE_SHAPE,
  UNKNOWN_SYMBOL,
  NON_TERMINAL_START_REQUIRED,
  EMPTY_GRAMMAR,
  UNDECLARED_START_SYMBOL,
  EMPTY_SYMBOL_SET,
  OVERLAPPING_SYMBOLS,
  RESERVED_SYMBOL,
  MISSING_ARROW,
  EMPTY_PRODUCTION,
  MALFORMED_DIRECTIVE,
};

// Any failure while declaring symbols, reading rules or building the
// automaton. The concrete subclass picks the message, `getKind()` tells
// callers which constraint was violated.
class GrammarException : public LinnetException {
public:
  GrammarExceptionKind getKind() const;

protected:
  GrammarException(GrammarExceptionKind kind, std::string source, Span span,
                   std::string line, std::string detail);

private:
  GrammarExceptionKind kind;
};

// Throws the exception for `kind`, pointing at `span` inside the line that
// `rule` was read from.
[[noreturn]] void throwOnRule(GrammarExceptionKind kind, const RawRule &rule,
                              Span span, std::string detail);
// Same, underlining the whole rule.
[[noreturn]] void throwOnRule(GrammarExceptionKind kind, const RawRule &rule,
                              std::string detail);
[[noreturn]] void throwOnLine(GrammarExceptionKind kind, std::string source,
                              std::string line, Span span, std::string detail);
// For errors that belong to no particular line, e.g. an empty symbol set.
[[noreturn]] void throwOnDeclaration(GrammarExceptionKind kind,
                                     std::string source, std::string detail);

} // namespace grammar

#endif
