// modgraph/sfc/raw_template_compiler.cpp - Static-markup template compiler
#include "modgraph/sfc/raw_template_compiler.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

#include "modgraph/basic/codegen_util.hpp"

namespace modgraph::sfc
{

namespace
{

constexpr std::array<std::string_view, 14> k_void_elements = {
  "area", "base", "br", "col", "embed", "hr", "img",
  "input", "link", "meta", "param", "source", "track", "wbr",
};

bool is_void_element(std::string_view name)
{
  return std::find(k_void_elements.begin(), k_void_elements.end(), name) != k_void_elements.end();
}

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }
bool is_tag_char(unsigned char c) { return (std::isalnum(c) != 0) || c == '-' || c == '_' || c == ':'; }

Position position_in(std::string_view text, size_t offset)
{
  Position p;
  p.line = 1;
  p.column = 1;
  p.offset = static_cast<uint32_t>(std::min(offset, text.size()));
  for (size_t i = 0; i < p.offset; ++i) {
    if (text[i] == '\n') {
      ++p.line;
      p.column = 1;
    } else {
      ++p.column;
    }
  }
  return p;
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

class MarkupRewriter
{
public:
  MarkupRewriter(const TemplateRequest & request, std::vector<SfcError> & errors)
  : req_(request), src_(request.source), errors_(errors)
  {
  }

  std::string run()
  {
    while (pos_ < src_.size()) {
      const size_t lt = src_.find('<', pos_);
      if (lt == std::string_view::npos) {
        out_.append(src_.substr(pos_));
        break;
      }
      out_.append(src_.substr(pos_, lt - pos_));
      pos_ = lt;

      if (starts_with("<!--")) {
        const size_t end = src_.find("-->", pos_);
        const size_t stop = end == std::string_view::npos ? src_.size() : end + 3;
        out_.append(src_.substr(pos_, stop - pos_));
        pos_ = stop;
      } else if (starts_with("</")) {
        end_tag(lt);
      } else if (std::isalpha(static_cast<unsigned char>(peek(1))) != 0) {
        start_tag(lt);
      } else {
        out_ += '<';
        ++pos_;
      }
    }

    for (const auto & [name, offset] : open_) {
      report("Element is missing end tag.", offset, offset + name.size() + 1);
    }
    return std::move(out_);
  }

  [[nodiscard]] uint32_t root_count() const noexcept { return roots_; }

private:
  [[nodiscard]] char peek(size_t ahead = 0) const noexcept
  {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept
  {
    return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
  }

  void report(std::string message, size_t begin, size_t end)
  {
    SfcError err;
    err.message = std::move(message);
    err.start = position_in(src_, begin);
    err.end = position_in(src_, end);
    errors_.push_back(std::move(err));
  }

  std::string read_name()
  {
    const size_t begin = pos_;
    while (pos_ < src_.size() && is_tag_char(static_cast<unsigned char>(peek()))) {
      ++pos_;
    }
    return std::string(src_.substr(begin, pos_ - begin));
  }

  void end_tag(size_t lt)
  {
    pos_ += 2;
    const std::string name = read_name();
    const size_t gt = src_.find('>', pos_);
    const size_t stop = gt == std::string_view::npos ? src_.size() : gt + 1;
    out_.append(src_.substr(lt, stop - lt));
    pos_ = stop;

    const auto it = std::find_if(open_.rbegin(), open_.rend(), [&](const auto & e) {
      return e.first == name;
    });
    if (it == open_.rend()) {
      report("Invalid end tag.", lt, stop);
      return;
    }
    // Elements left open inside the closed one.
    for (auto inner = open_.rbegin(); inner != it; ++inner) {
      report("Element is missing end tag.", inner->second, inner->second + inner->first.size() + 1);
    }
    open_.erase(std::next(it).base(), open_.end());
  }

  void start_tag(size_t lt)
  {
    ++pos_;
    const std::string name = read_name();
    out_ += '<';
    out_ += name;
    if (req_.scope_id) {
      out_ += ' ';
      out_ += *req_.scope_id;
    }

    bool self_closing = false;
    bool closed = false;
    while (pos_ < src_.size()) {
      if (is_space(peek())) {
        out_ += peek();
        ++pos_;
        continue;
      }
      if (peek() == '>') {
        out_ += '>';
        ++pos_;
        closed = true;
        break;
      }
      if (starts_with("/>")) {
        out_ += "/>";
        pos_ += 2;
        self_closing = true;
        closed = true;
        break;
      }
      attribute();
    }

    if (!closed) {
      report("Unexpected EOF in tag.", lt, src_.size());
      return;
    }
    if (open_.empty()) {
      ++roots_;
    }
    if (!self_closing && !is_void_element(name)) {
      open_.emplace_back(name, lt);
    }
  }

  void attribute()
  {
    const size_t key_begin = pos_;
    while (pos_ < src_.size() && !is_space(peek()) && peek() != '=' && peek() != '>' &&
           !starts_with("/>")) {
      ++pos_;
    }
    const std::string_view key = src_.substr(key_begin, pos_ - key_begin);
    out_.append(key);
    if (key.empty()) {
      out_ += peek();
      ++pos_;
      return;
    }
    if (peek() != '=') {
      return;
    }
    out_ += '=';
    ++pos_;

    char quote = peek();
    std::string_view value;
    if (quote == '"' || quote == '\'') {
      const size_t close = src_.find(quote, pos_ + 1);
      const size_t end = close == std::string_view::npos ? src_.size() : close;
      value = src_.substr(pos_ + 1, end - pos_ - 1);
      pos_ = std::min(end + 1, src_.size());
    } else {
      quote = '"';
      const size_t begin = pos_;
      while (pos_ < src_.size() && !is_space(peek()) && peek() != '>') {
        ++pos_;
      }
      value = src_.substr(begin, pos_ - begin);
    }

    out_ += quote;
    if ((key == "src" || key == "href") && !value.empty() && value.front() == '.') {
      out_ += rebase(value);
    } else {
      out_.append(value);
    }
    out_ += quote;
  }

  [[nodiscard]] std::string rebase(std::string_view url) const
  {
    const std::filesystem::path base(req_.asset_base.empty() ? "/" : req_.asset_base);
    return (base / std::filesystem::path(url)).lexically_normal().generic_string();
  }

  const TemplateRequest & req_;
  std::string_view src_;
  std::vector<SfcError> & errors_;
  size_t pos_ = 0;
  std::string out_;

  // (element name, offset of its '<')
  std::vector<std::pair<std::string, size_t>> open_;
  uint32_t roots_ = 0;
};

}  // namespace

TemplateResult RawTemplateCompiler::compile(const TemplateRequest & request)
{
  TemplateResult result;

  if (!request.preprocess_lang.empty() && request.preprocess_lang != "html") {
    const auto located =
      request.preprocessor ? request.preprocessor(request.preprocess_lang) : std::nullopt;
    SfcError err;
    err.message =
      located ? fmt::format(
                  "template preprocessor \"{}\" ({}) is not supported; compiling as plain markup",
                  request.preprocess_lang, located->generic_string())
              : fmt::format(
                  "Component template requires preprocessor \"{}\", which is not installed.",
                  request.preprocess_lang);
    result.errors.push_back(std::move(err));
  }

  MarkupRewriter rewriter(request, result.errors);
  const std::string markup = rewriter.run();

  result.code = fmt::format(
    "import {{ createStaticVNode as _createStaticVNode }} from {}\n"
    "\n"
    "export function render(_ctx, _cache) {{\n"
    "  return _createStaticVNode({}, {})\n"
    "}}\n",
    json_quote(request.runtime_module), json_quote(trim(markup)), rewriter.root_count());
  result.map = request.in_map;
  return result;
}

}  // namespace modgraph::sfc
