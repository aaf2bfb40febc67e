// modgraph/extract/import_scanner.cpp - Lexical ES-module import scanner
#include "modgraph/extract/import_scanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace modgraph
{

namespace
{

// ============================================================================
// Tokenizer
// ============================================================================

enum class TokKind : uint8_t {
  Identifier,
  String,
  Template,
  Number,
  Regex,
  Punct,
  End,
};

struct Tok
{
  TokKind kind = TokKind::End;
  std::string_view text;
  uint32_t begin = 0;
  uint32_t end = 0;
};

bool is_ident_start(unsigned char c)
{
  return (std::isalpha(c) != 0) || c == '_' || c == '$' || c >= 0x80;
}
bool is_ident_continue(unsigned char c) { return is_ident_start(c) || (std::isdigit(c) != 0); }

// Keywords after which '/' starts a regular expression literal.
constexpr std::array<std::string_view, 14> k_regex_keywords = {
  "return", "typeof", "instanceof", "in",    "of",    "new",  "delete",
  "void",   "throw",  "case",       "do",    "else",  "yield", "await",
};

class Tokenizer
{
public:
  explicit Tokenizer(std::string_view src) : src_(src) {}

  std::vector<Tok> run()
  {
    if (starts_with("#!")) {
      skip_to_line_end();
    }

    while (true) {
      skip_trivia();
      if (eof()) {
        break;
      }

      const auto start = pos_;
      const auto c = static_cast<unsigned char>(peek());

      if (is_ident_start(c)) {
        while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
          advance(1);
        }
        push(TokKind::Identifier, start);
      } else if (std::isdigit(c) != 0) {
        while (!eof() && (is_ident_continue(static_cast<unsigned char>(peek())) || peek() == '.')) {
          advance(1);
        }
        push(TokKind::Number, start);
      } else if (c == '"' || c == '\'') {
        scan_string(static_cast<char>(c));
        push(TokKind::String, start);
      } else if (c == '`') {
        advance(1);
        scan_template(start);
      } else if (c == '/' && regex_allowed()) {
        scan_regex();
        push(TokKind::Regex, start);
      } else if (c == '{') {
        braces_.push_back(false);
        advance(1);
        push(TokKind::Punct, start);
      } else if (c == '}') {
        if (!braces_.empty() && braces_.back()) {
          // End of a `${...}` substitution: resume the template literal.
          braces_.pop_back();
          advance(1);
          scan_template(start);
          continue;
        }
        if (!braces_.empty()) {
          braces_.pop_back();
        }
        advance(1);
        push(TokKind::Punct, start);
      } else {
        advance(1);
        push(TokKind::Punct, start);
      }
    }

    return std::move(toks_);
  }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t ahead = 0) const noexcept
  {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept
  {
    return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
  }
  void advance(size_t n) { pos_ = std::min(pos_ + n, src_.size()); }

  void push(TokKind kind, size_t start)
  {
    Tok t;
    t.kind = kind;
    t.begin = static_cast<uint32_t>(start);
    t.end = static_cast<uint32_t>(pos_);
    t.text = src_.substr(start, pos_ - start);
    toks_.push_back(t);
  }

  void skip_to_line_end()
  {
    while (!eof() && peek() != '\n') {
      advance(1);
    }
  }

  void skip_trivia()
  {
    while (!eof()) {
      const char c = peek();
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        advance(1);
      } else if (starts_with("//")) {
        skip_to_line_end();
      } else if (starts_with("/*")) {
        advance(2);
        while (!eof() && !starts_with("*/")) {
          advance(1);
        }
        advance(2);
      } else {
        break;
      }
    }
  }

  void scan_string(char quote)
  {
    advance(1);
    while (!eof()) {
      const char c = peek();
      if (c == '\\') {
        advance(2);
      } else if (c == quote) {
        advance(1);
        return;
      } else if (c == '\n') {
        return;  // unterminated
      } else {
        advance(1);
      }
    }
  }

  // Scans template text up to the closing backtick or the next `${`.
  void scan_template(size_t start)
  {
    while (!eof()) {
      const char c = peek();
      if (c == '\\') {
        advance(2);
      } else if (c == '`') {
        advance(1);
        break;
      } else if (c == '$' && peek(1) == '{') {
        advance(2);
        braces_.push_back(true);
        break;
      } else {
        advance(1);
      }
    }
    push(TokKind::Template, start);
  }

  void scan_regex()
  {
    advance(1);
    bool in_class = false;
    while (!eof()) {
      const char c = peek();
      if (c == '\\') {
        advance(2);
        continue;
      }
      if (c == '\n') {
        break;
      }
      advance(1);
      if (c == '[') {
        in_class = true;
      } else if (c == ']') {
        in_class = false;
      } else if (c == '/' && !in_class) {
        break;
      }
    }
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
  }

  [[nodiscard]] bool regex_allowed() const
  {
    if (toks_.empty()) {
      return true;
    }
    const Tok & last = toks_.back();
    switch (last.kind) {
      case TokKind::Identifier:
        return std::find(k_regex_keywords.begin(), k_regex_keywords.end(), last.text) !=
               k_regex_keywords.end();
      case TokKind::Template:
        return last.text.size() >= 2 && last.text.substr(last.text.size() - 2) == "${";
      case TokKind::Punct:
        return last.text != ")" && last.text != "]" && last.text != "}";
      default:
        return false;
    }
  }

  std::string_view src_;
  size_t pos_ = 0;
  std::vector<Tok> toks_;

  // Open braces; true marks a template substitution
  std::vector<bool> braces_;
};

// ============================================================================
// Statement recognizer
// ============================================================================

std::string unquote(std::string_view text)
{
  if (text.size() >= 2 && text.back() == text.front()) {
    return std::string(text.substr(1, text.size() - 2));
  }
  return std::string(text.substr(1));
}

class StatementScanner
{
public:
  StatementScanner(std::string_view src, std::vector<Tok> toks) : src_(src), toks_(std::move(toks))
  {
  }

  ScanResult run()
  {
    size_t i = 0;
    while (i < toks_.size()) {
      const bool member_access = i > 0 && is_punct(i - 1, '.');
      if (!member_access && is_ident(i, "import")) {
        i = parse_import(i);
      } else if (!member_access && is_ident(i, "export")) {
        i = parse_export(i);
      } else {
        ++i;
      }
    }
    return std::move(result_);
  }

private:
  [[nodiscard]] const Tok & at(size_t i) const { return i < toks_.size() ? toks_[i] : end_; }

  [[nodiscard]] bool is_ident(size_t i, std::string_view word) const
  {
    return at(i).kind == TokKind::Identifier && at(i).text == word;
  }
  [[nodiscard]] bool is_punct(size_t i, char c) const
  {
    return at(i).kind == TokKind::Punct && at(i).text.size() == 1 && at(i).text[0] == c;
  }
  [[nodiscard]] bool is_string(size_t i) const { return at(i).kind == TokKind::String; }

  void record(size_t first, size_t last, size_t spec_index, bool dynamic)
  {
    if (!dynamic && is_punct(last + 1, ';')) {
      ++last;
    }
    ImportRecord rec;
    rec.specifier = unquote(at(spec_index).text);
    rec.dynamic = dynamic;
    rec.offset = at(first).begin;
    rec.statement = std::string(src_.substr(at(first).begin, at(last).end - at(first).begin));
    result_.imports.push_back(std::move(rec));
  }

  void add_export(std::string name)
  {
    if (std::find(result_.exports.begin(), result_.exports.end(), name) == result_.exports.end()) {
      result_.exports.push_back(std::move(name));
    }
  }

  size_t parse_import(size_t i)
  {
    const size_t j = i + 1;

    // import("m")
    if (is_punct(j, '(')) {
      if (is_string(j + 1) && is_punct(j + 2, ')')) {
        record(i, j + 2, j + 1, true);
        return j + 3;
      }
      return j;
    }

    // import.meta
    if (is_punct(j, '.')) {
      return j;
    }

    // import "m"
    if (is_string(j)) {
      record(i, j, j, false);
      return j + 1;
    }

    // import <clause> from "m"
    for (size_t k = j; k < toks_.size(); ++k) {
      if (is_ident(k, "from") && is_string(k + 1)) {
        record(i, k + 1, k + 1, false);
        return k + 2;
      }
      const Tok & t = at(k);
      const bool clause_token =
        t.kind == TokKind::Identifier || is_punct(k, ',') || is_punct(k, '{') ||
        is_punct(k, '}') || is_punct(k, '*') || (t.kind == TokKind::String && is_ident(k + 1, "as"));
      if (!clause_token) {
        break;
      }
    }
    return j;
  }

  size_t parse_export(size_t i)
  {
    const size_t j = i + 1;

    if (is_ident(j, "default")) {
      add_export("default");
      return j + 1;
    }

    if (is_punct(j, '*')) {
      size_t k = j + 1;
      if (is_ident(k, "as")) {
        const Tok & name = at(k + 1);
        add_export(name.kind == TokKind::String ? unquote(name.text) : std::string(name.text));
        k += 2;
      }
      if (is_ident(k, "from") && is_string(k + 1)) {
        record(i, k + 1, k + 1, false);
        return k + 2;
      }
      return k;
    }

    if (is_punct(j, '{')) {
      size_t k = j + 1;
      while (k < toks_.size() && !is_punct(k, '}')) {
        const Tok & local = at(k);
        if (local.kind != TokKind::Identifier && local.kind != TokKind::String) {
          ++k;
          continue;
        }
        if (is_ident(k, "type") && at(k + 1).kind == TokKind::Identifier) {
          k += 2;  // TypeScript `type X`: no runtime binding
          continue;
        }
        std::string name = local.kind == TokKind::String ? unquote(local.text) : std::string(local.text);
        ++k;
        if (is_ident(k, "as")) {
          const Tok & alias = at(k + 1);
          name = alias.kind == TokKind::String ? unquote(alias.text) : std::string(alias.text);
          k += 2;
        }
        add_export(std::move(name));
      }
      ++k;  // '}'
      if (is_ident(k, "from") && is_string(k + 1)) {
        record(i, k + 1, k + 1, false);
        return k + 2;
      }
      return k;
    }

    if (is_ident(j, "const") || is_ident(j, "let") || is_ident(j, "var")) {
      return parse_declarators(j + 1);
    }

    size_t k = j;
    if (is_ident(k, "async")) {
      ++k;
    }
    if (is_ident(k, "function")) {
      ++k;
      if (is_punct(k, '*')) {
        ++k;
      }
      if (at(k).kind == TokKind::Identifier) {
        add_export(std::string(at(k).text));
      }
      return k;
    }
    if (is_ident(k, "class") && at(k + 1).kind == TokKind::Identifier) {
      add_export(std::string(at(k + 1).text));
      return k + 1;
    }
    return j;
  }

  // `a = 1, { b, c: d } = obj, [e] = arr`
  size_t parse_declarators(size_t k)
  {
    while (k < toks_.size()) {
      k = parse_binding(k);

      // Skip the initializer up to the next top-level ',' or the end of the
      // statement.
      int depth = 0;
      while (k < toks_.size()) {
        if (is_punct(k, '(') || is_punct(k, '[') || is_punct(k, '{')) {
          ++depth;
        } else if (is_punct(k, ')') || is_punct(k, ']') || is_punct(k, '}')) {
          if (depth == 0) {
            return k;
          }
          --depth;
        } else if (depth == 0 && (is_punct(k, ';') || starts_statement(k))) {
          return k;
        } else if (depth == 0 && is_punct(k, ',')) {
          break;
        }
        ++k;
      }
      if (k >= toks_.size()) {
        return k;
      }
      ++k;  // ','
    }
    return k;
  }

  size_t parse_binding(size_t k)
  {
    if (at(k).kind == TokKind::Identifier) {
      add_export(std::string(at(k).text));
      return k + 1;
    }
    if (!is_punct(k, '{') && !is_punct(k, '[')) {
      return k;
    }

    int depth = 0;
    do {
      if (is_punct(k, '{') || is_punct(k, '[')) {
        ++depth;
      } else if (is_punct(k, '}') || is_punct(k, ']')) {
        --depth;
      } else if (
        at(k).kind == TokKind::Identifier && !is_punct(k + 1, ':') && !is_punct(k - 1, '=')) {
        add_export(std::string(at(k).text));
      }
      ++k;
    } while (k < toks_.size() && depth > 0);
    return k;
  }

  [[nodiscard]] bool starts_statement(size_t k) const
  {
    return is_ident(k, "import") || is_ident(k, "export") || is_ident(k, "const") ||
           is_ident(k, "let") || is_ident(k, "var") || is_ident(k, "function") ||
           is_ident(k, "class");
  }

  std::string_view src_;
  std::vector<Tok> toks_;
  Tok end_;
  ScanResult result_;
};

}  // namespace

// ============================================================================
// ImportScanner
// ============================================================================

ScanResult ImportScanner::scan(std::string_view code)
{
  Tokenizer tokenizer(code);
  StatementScanner scanner(code, tokenizer.run());
  return scanner.run();
}

ExtractResult ImportScanner::extract(
  std::string_view code, const std::string & importer, ModuleResolver & resolver)
{
  auto scanned = scan(code);

  ExtractResult out;
  out.exports = std::move(scanned.exports);
  out.dependencies.reserve(scanned.imports.size());
  for (auto & rec : scanned.imports) {
    DependencyEdge edge;
    edge.module = resolver.resolve(rec.specifier, importer);
    edge.specifier = std::move(rec.specifier);
    edge.statement = std::move(rec.statement);
    edge.dynamic = rec.dynamic;
    out.dependencies.push_back(std::move(edge));
  }
  return out;
}

}  // namespace modgraph
