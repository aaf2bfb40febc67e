// modgraph/sfc/descriptor.hpp - Structured view of a composite-component file
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace modgraph::sfc
{

/**
 * Position reported by the composite-file collaborators.
 *
 * `line` and `column` are 1-based, `offset` is a 0-based byte offset. Which
 * text they are relative to depends on the producer (see SfcError).
 */
struct Position
{
  uint32_t line = 0;
  uint32_t column = 0;
  uint32_t offset = 0;
};

/**
 * Error returned by a parser/compiler/processor. Errors never abort the
 * caller; a message without location is a plain string error.
 */
struct SfcError
{
  std::string message;
  std::optional<Position> start;
  std::optional<Position> end;
};

/// One top-level section of a composite file.
struct Block
{
  std::string type;  // "script" | "template" | "style"
  std::string content;
  std::map<std::string, std::string> attrs;
  std::string lang;

  /// Byte offset / 1-based line of the first content character in the file
  uint32_t content_offset = 0;
  uint32_t start_line = 1;

  /// JSON source map of the block content back into the file (may be empty)
  std::string map;

  [[nodiscard]] bool operator==(const Block & other) const
  {
    return type == other.type && content == other.content && attrs == other.attrs &&
           lang == other.lang;
  }
  [[nodiscard]] bool operator!=(const Block & other) const { return !(*this == other); }
};

struct StyleBlock : Block
{
  bool scoped = false;

  /// CSS-module semantics requested (`module` attribute)
  bool is_module = false;

  /// Custom module name (`module="name"`); empty selects "$style"
  std::string module_name;

  [[nodiscard]] std::string effective_module_name() const
  {
    return module_name.empty() ? std::string("$style") : module_name;
  }
};

struct Descriptor
{
  std::string filename;
  std::string source;

  std::optional<Block> script;
  std::optional<Block> template_block;
  std::vector<StyleBlock> styles;

  [[nodiscard]] bool has_scoped_style() const
  {
    for (const auto & s : styles) {
      if (s.scoped) {
        return true;
      }
    }
    return false;
  }
};

}  // namespace modgraph::sfc
