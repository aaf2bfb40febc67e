// modgraph/basic/codegen_util.hpp - Helpers for emitting JavaScript text
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace modgraph
{

/// JSON string literal for `text` (what JSON.stringify produces for a string).
[[nodiscard]] std::string json_quote(std::string_view text);

/// Standard base64 with padding.
[[nodiscard]] std::string base64_encode(std::string_view data);

/**
 * Trailing inline source-map comment for a JSON source map.
 *
 * Returns "\n//# sourceMappingURL=data:application/json;base64,<...>", or an
 * empty string when `map_json` is empty.
 */
[[nodiscard]] std::string inline_source_map(std::string_view map_json);

/// One base64-VLQ field of a source-map `mappings` string.
[[nodiscard]] std::string base64_vlq(int32_t value);

/**
 * Source map (JSON) mapping each line of a block extracted verbatim from
 * `source` back to its position there.
 *
 * @param first_line   1-based line of the block's first character
 * @param first_column 1-based column of the block's first character
 * @param line_count   Number of lines in the block
 */
[[nodiscard]] std::string line_source_map(
  const std::string & filename, std::string_view source, uint32_t first_line,
  uint32_t first_column, uint32_t line_count);

}  // namespace modgraph
