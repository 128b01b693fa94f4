#ifndef __LINNET_UTILS__
#define __LINNET_UTILS__

#include <exception>
#include <optional>
#include <string>

struct Position {
  // Line number starting at `1`
  unsigned int line;
  // Column number starting at `1`
  unsigned int column;
};

struct Span {
  Position start;
  Position end;
};

// Base of every error reported to the user.
// `what()` renders the message, the source it came from and, when the
// offending line is known, the line with the span underlined.
class LinnetException : public std::exception {
private:
  Span span;
  std::optional<std::string> line;
  std::string detail;
  mutable std::string rendered;
  virtual const char *message() const;

protected:
  LinnetException(std::string source, Span span, std::string line,
                  std::string detail);
  std::string source;

public:
  const char *what() const noexcept override;

  const std::string &getSource() const;
  const std::string &getDetail() const;
  const std::optional<std::string> &getLine() const;
  Span getSpan() const;

  template <class T>
  static std::optional<T> newLinnetException(std::string source, Span span,
                                             std::optional<std::string> line,
                                             std::string detail = "") {
    if (span.start.line != span.end.line && span.start.column > span.end.column)
      return std::nullopt;

    return T(source, span, line.value_or(""), detail);
  }
};

class UnableToOpenFileException : public LinnetException {
  const char *message() const override;

  UnableToOpenFileException(std::string source, Span span, std::string line,
                            std::string detail);

  friend class LinnetException;
};

#endif
