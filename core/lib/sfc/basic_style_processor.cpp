// modgraph/sfc/basic_style_processor.cpp - Scoping / CSS-module style processor
#include "modgraph/sfc/basic_style_processor.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace modgraph::sfc
{

namespace
{

constexpr std::string_view k_scope_prefix = "data-v-";
constexpr std::string_view k_default_scoped_name = "[local]_[hash]";

// At-rules whose body holds rules (and therefore selectors).
constexpr std::array<std::string_view, 5> k_conditional_at_rules = {
  "media", "supports", "document", "layer", "container",
};

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }
bool is_ident_char(unsigned char c) { return (std::isalnum(c) != 0) || c == '-' || c == '_' || c >= 0x80; }

std::string replace_all(std::string text, std::string_view from, std::string_view to)
{
  size_t at = 0;
  while ((at = text.find(from, at)) != std::string::npos) {
    text.replace(at, from.size(), to);
    at += to.size();
  }
  return text;
}

/// Package implementing a style preprocessing language; empty for plain CSS.
std::string preprocessor_package(std::string_view lang)
{
  if (lang == "scss" || lang == "sass") {
    return "sass";
  }
  if (lang == "less") {
    return "less";
  }
  if (lang == "styl" || lang == "stylus") {
    return "stylus";
  }
  return {};
}

class SelectorRewriter
{
public:
  explicit SelectorRewriter(const StyleRequest & request) : req_(request)
  {
    hash_ = req_.id.rfind(k_scope_prefix, 0) == 0 ? req_.id.substr(k_scope_prefix.size()) : req_.id;
    pattern_ = std::string(k_default_scoped_name);
    if (req_.config) {
      if (const auto it = req_.config->options.find("generate_scoped_name");
          it != req_.config->options.end() && !it->second.empty()) {
        pattern_ = it->second;
      }
    }
  }

  /// Rewrites a whole selector list, keeping surrounding whitespace.
  std::string rewrite_list(std::string_view prelude)
  {
    size_t lead = 0;
    while (lead < prelude.size() && is_space(prelude[lead])) {
      ++lead;
    }
    size_t tail = prelude.size();
    while (tail > lead && is_space(prelude[tail - 1])) {
      --tail;
    }

    std::string out(prelude.substr(0, lead));
    const std::string_view list = prelude.substr(lead, tail - lead);

    int depth = 0;
    size_t piece_begin = 0;
    for (size_t i = 0; i <= list.size(); ++i) {
      const char c = i < list.size() ? list[i] : ',';
      if (c == '(' || c == '[') {
        ++depth;
      } else if ((c == ')' || c == ']') && depth > 0) {
        --depth;
      } else if (c == ',' && depth == 0) {
        out += rewrite_selector(list.substr(piece_begin, i - piece_begin));
        if (i < list.size()) {
          out += ',';
        }
        piece_begin = i + 1;
      }
    }

    out.append(prelude.substr(tail));
    return out;
  }

  [[nodiscard]] std::map<std::string, std::string> take_modules() { return std::move(modules_); }

private:
  std::string rewrite_selector(std::string_view piece)
  {
    size_t lead = 0;
    while (lead < piece.size() && is_space(piece[lead])) {
      ++lead;
    }
    std::string selector(piece.substr(lead));
    while (!selector.empty() && is_space(selector.back())) {
      selector.pop_back();
    }
    if (selector.empty()) {
      return std::string(piece);
    }

    if (req_.modules) {
      selector = rename_classes(selector);
    }
    if (req_.scoped) {
      selector = add_scope(selector);
    }
    return std::string(piece.substr(0, lead)) + selector;
  }

  std::string rename_classes(const std::string & selector)
  {
    std::string out;
    int brackets = 0;
    for (size_t i = 0; i < selector.size(); ++i) {
      const char c = selector[i];
      if (c == '[') {
        ++brackets;
      } else if (c == ']' && brackets > 0) {
        --brackets;
      }
      if (c != '.' || brackets > 0 || i + 1 >= selector.size() ||
          !is_ident_char(static_cast<unsigned char>(selector[i + 1]))) {
        out += c;
        continue;
      }

      size_t end = i + 1;
      while (end < selector.size() && is_ident_char(static_cast<unsigned char>(selector[end]))) {
        ++end;
      }
      const std::string local = selector.substr(i + 1, end - i - 1);
      auto [it, inserted] = modules_.emplace(local, std::string());
      if (inserted) {
        it->second = replace_all(replace_all(pattern_, "[local]", local), "[hash]", hash_);
      }
      out += '.';
      out += it->second;
      i = end - 1;
    }
    return out;
  }

  std::string add_scope(const std::string & selector) const
  {
    // Start of the last compound selector.
    int depth = 0;
    size_t compound = 0;
    for (size_t i = 0; i < selector.size(); ++i) {
      const char c = selector[i];
      if (c == '(' || c == '[') {
        ++depth;
      } else if ((c == ')' || c == ']') && depth > 0) {
        --depth;
      } else if (depth == 0 && (is_space(c) || c == '>' || c == '+' || c == '~')) {
        compound = i + 1;
      }
    }

    // Before the first pseudo class / element of that compound.
    size_t insert_at = selector.size();
    depth = 0;
    for (size_t i = compound; i < selector.size(); ++i) {
      const char c = selector[i];
      if (c == '(' || c == '[') {
        ++depth;
      } else if ((c == ')' || c == ']') && depth > 0) {
        --depth;
      } else if (depth == 0 && c == ':') {
        insert_at = i;
        break;
      }
    }

    std::string out = selector;
    out.insert(insert_at, "[" + req_.id + "]");
    return out;
  }

  const StyleRequest & req_;
  std::string hash_;
  std::string pattern_;
  std::map<std::string, std::string> modules_;
};

enum class BlockKind : uint8_t {
  Rules,         // top level, @media, @supports...
  Declarations,  // a style rule body
  Opaque,        // @keyframes, @font-face, nested bodies
};

class StyleRewriter
{
public:
  StyleRewriter(const StyleRequest & request, StyleResult & result)
  : req_(request), src_(request.source), result_(result), selectors_(request)
  {
    line_offsets_.push_back(0);
    for (size_t i = 0; i < src_.size(); ++i) {
      if (src_[i] == '\n') {
        line_offsets_.push_back(static_cast<uint32_t>(i + 1));
      }
    }
  }

  void run()
  {
    stack_.push_back({BlockKind::Rules, 0});

    size_t pos = 0;
    while (pos < src_.size()) {
      const char c = src_[pos];

      if (c == '/' && pos + 1 < src_.size() && src_[pos + 1] == '*') {
        const size_t end = src_.find("*/", pos + 2);
        if (end == std::string_view::npos) {
          report("Unclosed comment", pos);
          pos = src_.size();
          break;
        }
        // A comment ahead of a selector stays out of the selector text.
        if (stack_.back().kind == BlockKind::Rules && is_blank(prelude_begin_, pos)) {
          prelude_begin_ = end + 2;
        }
        pos = end + 2;
        continue;
      }

      if (c == '"' || c == '\'') {
        pos = skip_string(pos, c);
        continue;
      }

      if (c == '{') {
        open_block(pos);
      } else if (c == '}') {
        if (stack_.size() == 1) {
          report("Unexpected }", pos);
        } else {
          stack_.pop_back();
        }
        prelude_begin_ = pos + 1;
      } else if (c == ';' && stack_.back().kind == BlockKind::Rules) {
        prelude_begin_ = pos + 1;
      }
      ++pos;
    }

    if (stack_.size() > 1) {
      report("Unclosed block", stack_.back().open_offset);
    }

    out_.append(src_.substr(copied_));
    result_.code = std::move(out_);
    if (req_.modules) {
      result_.modules = selectors_.take_modules();
    }
  }

private:
  struct OpenBlock
  {
    BlockKind kind;
    size_t open_offset;
  };

  [[nodiscard]] bool is_blank(size_t begin, size_t end) const
  {
    for (size_t i = begin; i < end; ++i) {
      if (!is_space(src_[i])) {
        return false;
      }
    }
    return true;
  }

  size_t skip_string(size_t pos, char quote) const
  {
    ++pos;
    while (pos < src_.size() && src_[pos] != quote && src_[pos] != '\n') {
      pos += src_[pos] == '\\' ? 2 : 1;
    }
    return std::min(pos + 1, src_.size());
  }

  void open_block(size_t brace)
  {
    const BlockKind parent = stack_.back().kind;
    if (parent != BlockKind::Rules) {
      stack_.push_back({BlockKind::Opaque, brace});
      return;
    }

    const std::string_view prelude = src_.substr(prelude_begin_, brace - prelude_begin_);
    size_t first = 0;
    while (first < prelude.size() && is_space(prelude[first])) {
      ++first;
    }

    if (first < prelude.size() && prelude[first] == '@') {
      size_t end = first + 1;
      while (end < prelude.size() && is_ident_char(static_cast<unsigned char>(prelude[end]))) {
        ++end;
      }
      const std::string_view name = prelude.substr(first + 1, end - first - 1);
      const bool holds_rules =
        std::find(k_conditional_at_rules.begin(), k_conditional_at_rules.end(), name) !=
        k_conditional_at_rules.end();
      stack_.push_back({holds_rules ? BlockKind::Rules : BlockKind::Opaque, brace});
    } else {
      out_.append(src_.substr(copied_, prelude_begin_ - copied_));
      out_ += selectors_.rewrite_list(prelude);
      copied_ = brace;
      stack_.push_back({BlockKind::Declarations, brace});
    }
    prelude_begin_ = brace + 1;
  }

  void report(std::string_view message, size_t offset)
  {
    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    --it;
    Position p;
    p.line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
    p.column = static_cast<uint32_t>(offset - *it) + 1;
    p.offset = static_cast<uint32_t>(offset);

    SfcError err;
    err.message = fmt::format("{}:{}:{}: {}", req_.filename, p.line, p.column, message);
    err.start = p;
    result_.errors.push_back(std::move(err));
  }

  const StyleRequest & req_;
  std::string_view src_;
  StyleResult & result_;
  SelectorRewriter selectors_;

  std::vector<uint32_t> line_offsets_;
  std::vector<OpenBlock> stack_;
  size_t prelude_begin_ = 0;
  size_t copied_ = 0;
  std::string out_;
};

}  // namespace

StyleResult BasicStyleProcessor::compile(const StyleRequest & request)
{
  StyleResult result;

  const std::string package = preprocessor_package(request.preprocess_lang);
  if (!package.empty()) {
    const auto located = request.preprocessor ? request.preprocessor(package) : std::nullopt;
    SfcError err;
    err.message = located
                    ? fmt::format(
                        "style preprocessor \"{}\" is not supported; processing as plain CSS",
                        request.preprocess_lang)
                    : fmt::format(
                        "Preprocessor dependency \"{}\" not found. Did you install it?", package);
    result.errors.push_back(std::move(err));
  }

  StyleRewriter rewriter(request, result);
  rewriter.run();
  return result;
}

}  // namespace modgraph::sfc
