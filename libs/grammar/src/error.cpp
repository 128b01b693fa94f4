#include <optional>
#include <string>
#include <utility>

#include "error.hpp"

namespace grammar {

GrammarException::GrammarException(GrammarExceptionKind kind,
                                   std::string source, Span span,
                                   std::string line, std::string detail)
    : LinnetException(std::move(source), span, std::move(line),
                      std::move(detail)),
      kind(kind) {}

GrammarExceptionKind GrammarException::getKind() const { return this->kind; }

class InvalidRuleShapeException : public GrammarException {
  const char *message() const override {
    return "Rule is not of the form `A -> aB`, `A -> a` or `A -> epsilon`:";
  }

  InvalidRuleShapeException(std::string source, Span span, std::string line,
                            std::string detail)
      : GrammarException(INVALID_RULE_SHAPE, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class UnknownSymbolException : public GrammarException {
  const char *message() const override {
    return "Rule uses an undeclared symbol:";
  }

  UnknownSymbolException(std::string source, Span span, std::string line,
                         std::string detail)
      : GrammarException(UNKNOWN_SYMBOL, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class NonTerminalStartRequiredException : public GrammarException {
  const char *message() const override {
    return "Expected a declared non-terminal on the left hand side of a "
           "grammar rule:";
  }

  NonTerminalStartRequiredException(std::string source, Span span,
                                    std::string line, std::string detail)
      : GrammarException(NON_TERMINAL_START_REQUIRED, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class EmptyGrammarException : public GrammarException {
  const char *message() const override {
    return "The grammar has no rules.";
  }

  EmptyGrammarException(std::string source, Span span, std::string line,
                        std::string detail)
      : GrammarException(EMPTY_GRAMMAR, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class UndeclaredStartSymbolException : public GrammarException {
  const char *message() const override {
    return "The start symbol is not a declared non-terminal:";
  }

  UndeclaredStartSymbolException(std::string source, Span span,
                                 std::string line, std::string detail)
      : GrammarException(UNDECLARED_START_SYMBOL, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class EmptySymbolSetException : public GrammarException {
  const char *message() const override {
    return "Missing symbol declarations:";
  }

  EmptySymbolSetException(std::string source, Span span, std::string line,
                          std::string detail)
      : GrammarException(EMPTY_SYMBOL_SET, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class OverlappingSymbolsException : public GrammarException {
  const char *message() const override {
    return "Terminals and non-terminals must be disjoint;";
  }

  OverlappingSymbolsException(std::string source, Span span, std::string line,
                              std::string detail)
      : GrammarException(OVERLAPPING_SYMBOLS, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class ReservedSymbolException : public GrammarException {
  const char *message() const override {
    return "Invalid symbol declaration:";
  }

  ReservedSymbolException(std::string source, Span span, std::string line,
                          std::string detail)
      : GrammarException(RESERVED_SYMBOL, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class MissingArrowException : public GrammarException {
  const char *message() const override {
    return "Expected `->` between the head and body of a grammar rule.";
  }

  MissingArrowException(std::string source, Span span, std::string line,
                        std::string detail)
      : GrammarException(MISSING_ARROW, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class EmptyProductionException : public GrammarException {
  const char *message() const override {
    return "Empty production in a grammar rule; use `epsilon` for the "
           "empty string.";
  }

  EmptyProductionException(std::string source, Span span, std::string line,
                           std::string detail)
      : GrammarException(EMPTY_PRODUCTION, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

class MalformedDirectiveException : public GrammarException {
  const char *message() const override {
    return "Malformed grammar file directive:";
  }

  MalformedDirectiveException(std::string source, Span span, std::string line,
                              std::string detail)
      : GrammarException(MALFORMED_DIRECTIVE, std::move(source), span,
                         std::move(line), std::move(detail)) {}

  friend class LinnetException;
};

template <class T>
[[noreturn]] static void throwGrammarException(std::string source, Span span,
                                               std::optional<std::string> line,
                                               std::string detail) {
  throw LinnetException::newLinnetException<T>(std::move(source), span,
                                               std::move(line),
                                               std::move(detail))
      .value();
}

void throwOnLine(GrammarExceptionKind kind, std::string source,
                 std::string line, Span span, std::string detail) {
  std::optional<std::string> excerpt =
      line.empty() ? std::nullopt : std::optional<std::string>(line);

  switch (kind) {
  case INVALID_RULE_SHAPE:
    throwGrammarException<InvalidRuleShapeException>(source, span, excerpt,
                                                     detail);
  case UNKNOWN_SYMBOL:
    throwGrammarException<UnknownSymbolException>(source, span, excerpt,
                                                  detail);
  case NON_TERMINAL_START_REQUIRED:
    throwGrammarException<NonTerminalStartRequiredException>(source, span,
                                                             excerpt, detail);
  case EMPTY_GRAMMAR:
    throwGrammarException<EmptyGrammarException>(source, span, excerpt,
                                                 detail);
  case UNDECLARED_START_SYMBOL:
    throwGrammarException<UndeclaredStartSymbolException>(source, span,
                                                          excerpt, detail);
  case EMPTY_SYMBOL_SET:
    throwGrammarException<EmptySymbolSetException>(source, span, excerpt,
                                                   detail);
  case OVERLAPPING_SYMBOLS:
    throwGrammarException<OverlappingSymbolsException>(source, span, excerpt,
                                                       detail);
  case RESERVED_SYMBOL:
    throwGrammarException<ReservedSymbolException>(source, span, excerpt,
                                                   detail);
  case MISSING_ARROW:
    throwGrammarException<MissingArrowException>(source, span, excerpt,
                                                 detail);
  case EMPTY_PRODUCTION:
    throwGrammarException<EmptyProductionException>(source, span, excerpt,
                                                    detail);
  case MALFORMED_DIRECTIVE:
  default:
    throwGrammarException<MalformedDirectiveException>(source, span, excerpt,
                                                       detail);
  }
}

void throwOnRule(GrammarExceptionKind kind, const RawRule &rule, Span span,
                 std::string detail) {
  throwOnLine(kind, rule.source, rule.text, span, std::move(detail));
}

void throwOnRule(GrammarExceptionKind kind, const RawRule &rule,
                 std::string detail) {
  unsigned int line = rule.line;
  unsigned int width = static_cast<unsigned int>(countCharacters(rule.text));
  Span span = {{line, 1}, {line, width + 1}};
  throwOnLine(kind, rule.source, rule.text, span, std::move(detail));
}

void throwOnDeclaration(GrammarExceptionKind kind, std::string source,
                        std::string detail) {
  throwOnLine(kind, std::move(source), "", {{0, 0}, {0, 0}},
              std::move(detail));
}

} // namespace grammar
