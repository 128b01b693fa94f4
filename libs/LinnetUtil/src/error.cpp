#include "LinnetUtil.hpp"
#include <algorithm>
#include <cstddef>
#include <utility>

LinnetException::LinnetException(std::string source, Span span,
                                 std::string line, std::string detail)
    : span(span),
      line(line == "" ? std::nullopt : std::optional<std::string>(line)),
      detail(std::move(detail)), source(std::move(source)) {}

const char *LinnetException::what() const noexcept {
  std::string err_str = "error: ";

  err_str += this->message();
  if (!this->detail.empty()) {
    err_str += " ";
    err_str += this->detail;
  }
  err_str += "\n  --> ";
  err_str += this->source;
  err_str += "\n";

  if (this->line.has_value()) {
    err_str += "\n";
    std::string line_str = std::to_string(this->span.start.line);
    size_t line_digits = line_str.length();

    line_str += ": ";
    line_str += this->line.value();
    line_str += "\n";

    for (size_t i = 0; i < line_digits + 1 + this->span.start.column; i++) {
      line_str.push_back(' ');
    }
    unsigned int span_width = this->span.end.column > this->span.start.column
                                  ? this->span.end.column -
                                        this->span.start.column
                                  : 0;
    for (unsigned int i = 0; i < std::max(1u, span_width); i++) {
      line_str.push_back('^');
    }
    line_str += "\n";

    err_str += line_str;
  }

  this->rendered = std::move(err_str);
  return this->rendered.c_str();
}

const std::string &LinnetException::getSource() const { return this->source; }

const std::string &LinnetException::getDetail() const { return this->detail; }

const std::optional<std::string> &LinnetException::getLine() const {
  return this->line;
}

Span LinnetException::getSpan() const { return this->span; }

const char *LinnetException::message() const { return "Linnet Exception"; }

const char *UnableToOpenFileException::message() const {
  return "Unable to open file.";
}

UnableToOpenFileException::UnableToOpenFileException(std::string source,
                                                     Span span,
                                                     std::string line,
                                                     std::string detail)
    : LinnetException(std::move(source), span, std::move(line),
                      std::move(detail)) {}
