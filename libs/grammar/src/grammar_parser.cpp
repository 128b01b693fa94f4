#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <utility>

#include "error.hpp"
#include "grammar_parser.hpp"

namespace grammar {

typedef std::vector<std::pair<std::size_t, std::string>> chunks;

// Splits `text` on whitespace, remembering the byte offset of every chunk
// relative to the start of the line
static chunks splitWhitespace(const std::string &text, std::size_t offset) {
  chunks result;

  std::size_t i = 0;
  while (i < text.length()) {
    if (isspace(static_cast<unsigned char>(text[i]))) {
      i++;
      continue;
    }

    std::size_t begin = i;
    while (i < text.length() && !isspace(static_cast<unsigned char>(text[i])))
      i++;
    result.push_back({offset + begin, text.substr(begin, i - begin)});
  }

  return result;
}

// Span of the `length` bytes at `offset` in `text`. Columns count UTF-8
// characters, not bytes.
static Span spanOf(const std::string &text, std::size_t line,
                   std::size_t offset, std::size_t length) {
  unsigned int l = static_cast<unsigned int>(line);
  unsigned int column =
      static_cast<unsigned int>(countCharacters(text.substr(0, offset))) + 1;
  unsigned int width =
      static_cast<unsigned int>(countCharacters(text.substr(offset, length)));
  return {{l, column}, {l, column + width}};
}

static RawToken tokenAt(const std::string &text, std::size_t line,
                        std::size_t offset, std::string token) {
  Span span = spanOf(text, line, offset, token.length());
  return {std::move(token), span};
}

static bool isBlankOrComment(const std::string &line) {
  for (char c : line) {
    if (isspace(static_cast<unsigned char>(c)))
      continue;
    return c == '#';
  }
  return true;
}

// Parses one alternative of a rule body. E.g. `a A` or `aA` in `S -> aA | b`
static std::vector<RawToken> parseAlternative(const std::string &line,
                                              const std::string &text,
                                              std::size_t offset,
                                              std::size_t line_number,
                                              const SymbolTables &symbols) {
  std::vector<RawToken> tokens;

  for (auto &[chunk_offset, chunk] : splitWhitespace(text, offset)) {
    if (isEpsilon(chunk) || symbols.getKind(chunk).has_value()) {
      tokens.push_back(tokenAt(line, line_number, chunk_offset, chunk));
      continue;
    }

    // Written without spaces, e.g. `aA`
    std::size_t symbol_offset = chunk_offset;
    for (std::string &symbol : symbols.tokenize(chunk, true)) {
      std::size_t length = symbol.length();
      tokens.push_back(
          tokenAt(line, line_number, symbol_offset, std::move(symbol)));
      symbol_offset += length;
    }
  }

  return tokens;
}

std::vector<RawRule> parseRuleLine(const std::string &line,
                                   std::size_t line_number,
                                   const std::string &source,
                                   const SymbolTables &symbols) {
  if (isBlankOrComment(line))
    return {};

  RawRule base;
  base.source = source;
  base.line = line_number;
  base.text = line;

  std::size_t arrow = line.find("->");
  if (arrow == std::string::npos)
    throwOnRule(MISSING_ARROW, base, "in `" + line + "`");

  chunks head = splitWhitespace(line.substr(0, arrow), 0);
  if (head.empty())
    throwOnRule(NON_TERMINAL_START_REQUIRED, base,
                spanOf(line, line_number, arrow, 2), "the rule head is empty");
  if (head.size() > 1) {
    std::size_t end = head.back().first + head.back().second.length();
    throwOnRule(INVALID_RULE_SHAPE, base,
                spanOf(line, line_number, head[1].first,
                       end - head[1].first),
                "the left hand side must be a single non-terminal");
  }
  base.head = tokenAt(line, line_number, head[0].first, head[0].second);

  std::size_t body_offset = arrow + 2;
  if (std::size_t second = line.find("->", body_offset);
      second != std::string::npos)
    throwOnRule(INVALID_RULE_SHAPE, base,
                spanOf(line, line_number, second, 2),
                "found more than one `->`");

  std::vector<RawRule> rules;

  std::size_t alt_offset = body_offset;
  while (true) {
    std::size_t bar = line.find('|', alt_offset);
    std::size_t alt_end = bar == std::string::npos ? line.length() : bar;
    std::string alternative = line.substr(alt_offset, alt_end - alt_offset);

    RawRule rule = base;
    rule.body = parseAlternative(line, alternative, alt_offset, line_number,
                                 symbols);
    if (rule.body.empty())
      throwOnRule(EMPTY_PRODUCTION, base,
                  spanOf(line, line_number, alt_offset,
                         std::max<std::size_t>(alt_end - alt_offset, 1)),
                  "for `" + base.head.text + "`");
    rules.push_back(std::move(rule));

    if (bar == std::string::npos)
      break;
    alt_offset = bar + 1;
  }

  return rules;
}

std::vector<RawRule> parseRuleLines(const std::vector<std::string> &lines,
                                    std::size_t first_line,
                                    const std::string &source,
                                    const SymbolTables &symbols) {
  std::vector<RawRule> rules;

  for (std::size_t i = 0; i < lines.size(); i++) {
    std::vector<RawRule> line_rules =
        parseRuleLine(lines[i], first_line + i, source, symbols);
    rules.insert(rules.end(), line_rules.begin(), line_rules.end());
  }

  return rules;
}

GrammarParser::GrammarParser(std::string file_name)
    : file_name(std::move(file_name)), pos({0, 1}), start_line({0, ""}) {
  this->grammar_fs.open(this->file_name);

  if (!this->grammar_fs.is_open())
    throw LinnetException::newLinnetException<UnableToOpenFileException>(
              this->file_name, {this->pos, this->pos}, std::nullopt)
        .value();
}

// Moves to the next line of the file
// If the EOF is reached, then `false` is returned
bool GrammarParser::nextLine() {
  if (!std::getline(this->grammar_fs, this->curr_line))
    return false;

  if (!this->curr_line.empty() && this->curr_line.back() == '\r')
    this->curr_line.pop_back();

  this->pos.line += 1;
  this->pos.column = 1;
  return true;
}

bool GrammarParser::isDirective() const {
  for (char c : this->curr_line) {
    if (isspace(static_cast<unsigned char>(c)))
      continue;
    return c == '%';
  }
  return false;
}

std::set<std::string> GrammarParser::parseSymbolList(std::size_t offset) const {
  std::set<std::string> symbols;
  for (auto &[_, symbol] :
       splitWhitespace(this->curr_line.substr(offset), offset))
    symbols.insert(symbol);
  return symbols;
}

// Parses a `%name symbols...` line
void GrammarParser::parseDirective() {
  std::size_t percent = this->curr_line.find('%');
  std::size_t name_end = percent + 1;
  while (name_end < this->curr_line.length() &&
         !isspace(static_cast<unsigned char>(this->curr_line[name_end])))
    name_end++;

  std::string name =
      this->curr_line.substr(percent + 1, name_end - percent - 1);
  Span name_span = spanOf(this->curr_line, this->pos.line, percent,
                          name_end - percent);
  std::set<std::string> symbols = this->parseSymbolList(name_end);

  if (name == "terminals") {
    this->terminals.merge(symbols);
  } else if (name == "nonterminals") {
    this->nonterminals.merge(symbols);
  } else if (name == "start") {
    if (this->start_symbol.has_value())
      throwOnLine(MALFORMED_DIRECTIVE, this->file_name, this->curr_line,
                  name_span, "the start symbol is declared twice");
    if (symbols.size() != 1)
      throwOnLine(MALFORMED_DIRECTIVE, this->file_name, this->curr_line,
                  name_span, "`%start` takes exactly one symbol");

    this->start_symbol = *symbols.begin();
    this->start_line = {this->pos.line, this->curr_line};
  } else {
    throwOnLine(MALFORMED_DIRECTIVE, this->file_name, this->curr_line,
                name_span, "unknown directive `%" + name + "`");
  }
}

std::unique_ptr<GrammarDefinition> GrammarParser::parseGrammar() {
  std::cout << "Parsing grammar file " << this->file_name << std::endl;

  while (this->nextLine()) {
    if (this->isDirective()) {
      if (!this->rule_lines.empty())
        throwOnLine(MALFORMED_DIRECTIVE, this->file_name, this->curr_line,
                    spanOf(this->curr_line, this->pos.line, 0,
                           this->curr_line.length()),
                    "directives must come before the grammar rules");
      this->parseDirective();
    } else if (!isBlankOrComment(this->curr_line)) {
      this->rule_lines.push_back({this->pos.line, this->curr_line});
    }
  }

  if (!this->start_symbol.has_value())
    throwOnDeclaration(UNDECLARED_START_SYMBOL, this->file_name,
                       "missing `%start` directive");

  SymbolTables symbols(this->terminals, this->nonterminals,
                       this->start_symbol.value());

  const auto &[start_number, start_text] = this->start_line;
  if (!symbols.isNonTerminal(this->start_symbol.value())) {
    std::size_t offset = start_text.rfind(this->start_symbol.value());
    throwOnLine(UNDECLARED_START_SYMBOL, this->file_name, start_text,
                spanOf(start_text, start_number, offset,
                       this->start_symbol->length()),
                "'" + this->start_symbol.value() + "'");
  }

  std::vector<RawRule> rules;
  for (const auto &[line_number, line] : this->rule_lines) {
    std::vector<RawRule> line_rules =
        parseRuleLine(line, line_number, this->file_name, symbols);
    rules.insert(rules.end(), line_rules.begin(), line_rules.end());
  }

  std::cout << "Done!" << std::endl;
  return std::make_unique<GrammarDefinition>(
      GrammarDefinition{std::move(symbols), std::move(rules)});
}

} // namespace grammar
