// modgraph/sfc/block_parser.cpp - Top-level block splitter
#include "modgraph/sfc/block_parser.hpp"

#include <algorithm>
#include <cctype>

#include "modgraph/basic/codegen_util.hpp"

namespace modgraph::sfc
{

namespace
{

bool is_tag_char(unsigned char c) { return (std::isalnum(c) != 0) || c == '-' || c == '_'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }

uint32_t count_lines(std::string_view text)
{
  return static_cast<uint32_t>(std::count(text.begin(), text.end(), '\n')) + 1;
}

class BlockScanner
{
public:
  BlockScanner(std::string_view src, const std::string & filename)
  : src_(src), filename_(filename)
  {
    line_offsets_.push_back(0);
    for (size_t i = 0; i < src_.size(); ++i) {
      if (src_[i] == '\n') {
        line_offsets_.push_back(static_cast<uint32_t>(i + 1));
      }
    }
  }

  ParseResult run()
  {
    result_.descriptor.filename = filename_;
    result_.descriptor.source = std::string(src_);

    while (pos_ < src_.size()) {
      const size_t lt = src_.find('<', pos_);
      if (lt == std::string_view::npos) {
        break;
      }
      pos_ = lt;

      if (starts_with("<!--")) {
        const size_t end = src_.find("-->", pos_ + 4);
        pos_ = end == std::string_view::npos ? src_.size() : end + 3;
        continue;
      }

      if (starts_with("</")) {
        const size_t gt = src_.find('>', pos_);
        const size_t end = gt == std::string_view::npos ? src_.size() : gt + 1;
        report("Invalid end tag.", lt, end);
        pos_ = end;
        continue;
      }

      if (!std::isalpha(static_cast<unsigned char>(peek(1)))) {
        ++pos_;
        continue;
      }

      if (!scan_element(lt)) {
        break;
      }
    }

    return std::move(result_);
  }

private:
  [[nodiscard]] char peek(size_t ahead = 0) const noexcept
  {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept
  {
    return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
  }

  [[nodiscard]] Position position_at(size_t offset) const
  {
    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    --it;
    Position p;
    p.line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
    p.column = static_cast<uint32_t>(offset - *it) + 1;
    p.offset = static_cast<uint32_t>(offset);
    return p;
  }

  void report(std::string message, size_t begin, size_t end)
  {
    SfcError err;
    err.message = std::move(message);
    err.start = position_at(begin);
    err.end = position_at(std::min(end, src_.size()));
    result_.errors.push_back(std::move(err));
  }

  // Returns false when the rest of the file cannot be scanned.
  bool scan_element(size_t lt)
  {
    ++pos_;  // '<'
    const size_t name_begin = pos_;
    while (pos_ < src_.size() && is_tag_char(static_cast<unsigned char>(peek()))) {
      ++pos_;
    }
    const std::string name(src_.substr(name_begin, pos_ - name_begin));

    std::map<std::string, std::string> attrs;
    bool self_closing = false;
    if (!scan_attributes(attrs, self_closing)) {
      report("Unexpected EOF in tag.", lt, src_.size());
      return false;
    }

    const size_t content_begin = pos_;
    size_t content_end = content_begin;
    if (!self_closing) {
      content_end = find_end_tag(name, content_begin);
      if (content_end == std::string_view::npos) {
        report("Element is missing end tag.", lt, content_begin);
        pos_ = src_.size();
        return false;
      }
      const size_t gt = src_.find('>', content_end);
      pos_ = gt == std::string_view::npos ? src_.size() : gt + 1;
    }

    add_block(name, std::move(attrs), lt, content_begin, content_end);
    return true;
  }

  bool scan_attributes(std::map<std::string, std::string> & attrs, bool & self_closing)
  {
    while (pos_ < src_.size()) {
      while (pos_ < src_.size() && is_space(peek())) {
        ++pos_;
      }
      if (peek() == '>') {
        ++pos_;
        return true;
      }
      if (starts_with("/>")) {
        pos_ += 2;
        self_closing = true;
        return true;
      }
      if (pos_ >= src_.size()) {
        break;
      }

      const size_t key_begin = pos_;
      while (pos_ < src_.size() && !is_space(peek()) && peek() != '=' && peek() != '>' &&
             !starts_with("/>")) {
        ++pos_;
      }
      std::string key(src_.substr(key_begin, pos_ - key_begin));
      if (key.empty()) {
        ++pos_;
        continue;
      }

      std::string value;
      if (peek() == '=') {
        ++pos_;
        const char quote = peek();
        if (quote == '"' || quote == '\'') {
          const size_t close = src_.find(quote, pos_ + 1);
          if (close == std::string_view::npos) {
            return false;
          }
          value = std::string(src_.substr(pos_ + 1, close - pos_ - 1));
          pos_ = close + 1;
        } else {
          const size_t value_begin = pos_;
          while (pos_ < src_.size() && !is_space(peek()) && peek() != '>') {
            ++pos_;
          }
          value = std::string(src_.substr(value_begin, pos_ - value_begin));
        }
      }
      attrs[std::move(key)] = std::move(value);
    }
    return false;
  }

  // Offset of the matching `</name`. Templates may nest <template> elements.
  [[nodiscard]] size_t find_end_tag(const std::string & name, size_t from) const
  {
    const std::string close = "</" + name;
    if (name != "template") {
      return src_.find(close, from);
    }

    int depth = 1;
    size_t at = from;
    while (true) {
      const size_t next_close = src_.find(close, at);
      if (next_close == std::string_view::npos) {
        return next_close;
      }
      const size_t next_open = find_open_tag(name, at);
      if (next_open != std::string_view::npos && next_open < next_close) {
        ++depth;
        at = next_open + name.size() + 1;
        continue;
      }
      if (--depth == 0) {
        return next_close;
      }
      at = next_close + close.size();
    }
  }

  [[nodiscard]] size_t find_open_tag(const std::string & name, size_t from) const
  {
    const std::string open = "<" + name;
    size_t at = src_.find(open, from);
    while (at != std::string_view::npos) {
      const size_t after = at + open.size();
      const char c = after < src_.size() ? src_[after] : '\0';
      if (is_space(c) || c == '>' || c == '/') {
        return at;
      }
      at = src_.find(open, after);
    }
    return at;
  }

  void fill_block(
    Block & block, const std::string & type, std::map<std::string, std::string> attrs,
    size_t content_begin, size_t content_end, bool with_map)
  {
    block.type = type;
    block.content = std::string(src_.substr(content_begin, content_end - content_begin));
    if (const auto it = attrs.find("lang"); it != attrs.end()) {
      block.lang = it->second;
    }
    block.attrs = std::move(attrs);
    block.content_offset = static_cast<uint32_t>(content_begin);

    const Position start = position_at(content_begin);
    block.start_line = start.line;
    if (with_map) {
      block.map = line_source_map(
        filename_, src_, start.line, start.column, count_lines(block.content));
    }
  }

  void add_block(
    const std::string & name, std::map<std::string, std::string> attrs, size_t lt,
    size_t content_begin, size_t content_end)
  {
    auto & desc = result_.descriptor;

    if (name == "script" || name == "template") {
      auto & slot = name == "script" ? desc.script : desc.template_block;
      if (slot) {
        report(
          "Single file component can contain only one <" + name + "> element", lt, content_begin);
        return;
      }
      Block block;
      fill_block(block, name, std::move(attrs), content_begin, content_end, true);
      slot = std::move(block);
      return;
    }

    if (name == "style") {
      StyleBlock block;
      block.scoped = attrs.count("scoped") > 0;
      if (const auto it = attrs.find("module"); it != attrs.end()) {
        block.is_module = true;
        block.module_name = it->second;
      }
      fill_block(block, name, std::move(attrs), content_begin, content_end, false);
      desc.styles.push_back(std::move(block));
    }

    // Custom blocks are skipped.
  }

  std::string_view src_;
  const std::string & filename_;
  size_t pos_ = 0;
  std::vector<uint32_t> line_offsets_;
  ParseResult result_;
};

}  // namespace

ParseResult BlockParser::parse(std::string_view source, const std::string & filename)
{
  BlockScanner scanner(source, filename);
  return scanner.run();
}

}  // namespace modgraph::sfc
