// modgraph/basic/codegen_util.cpp
#include "modgraph/basic/codegen_util.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace modgraph
{

std::string json_quote(std::string_view text)
{
  return nlohmann::json(std::string(text))
    .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string base64_encode(std::string_view data)
{
  static constexpr char k_alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    const uint32_t n = (static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16) |
                       (static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8) |
                       static_cast<uint32_t>(static_cast<unsigned char>(data[i + 2]));
    out += k_alphabet[(n >> 18) & 0x3F];
    out += k_alphabet[(n >> 12) & 0x3F];
    out += k_alphabet[(n >> 6) & 0x3F];
    out += k_alphabet[n & 0x3F];
  }

  const size_t rest = data.size() - i;
  if (rest == 1) {
    const uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16;
    out += k_alphabet[(n >> 18) & 0x3F];
    out += k_alphabet[(n >> 12) & 0x3F];
    out += "==";
  } else if (rest == 2) {
    const uint32_t n = (static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16) |
                       (static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8);
    out += k_alphabet[(n >> 18) & 0x3F];
    out += k_alphabet[(n >> 12) & 0x3F];
    out += k_alphabet[(n >> 6) & 0x3F];
    out += '=';
  }
  return out;
}

std::string inline_source_map(std::string_view map_json)
{
  if (map_json.empty()) {
    return {};
  }
  return "\n//# sourceMappingURL=data:application/json;base64," + base64_encode(map_json);
}

std::string base64_vlq(int32_t value)
{
  static constexpr char k_alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  // Sign goes into the lowest bit.
  uint32_t vlq = value < 0 ? ((static_cast<uint32_t>(-static_cast<int64_t>(value)) << 1) | 1U)
                           : (static_cast<uint32_t>(value) << 1);
  std::string out;
  do {
    uint32_t digit = vlq & 0x1FU;
    vlq >>= 5;
    if (vlq > 0) {
      digit |= 0x20U;  // continuation
    }
    out += k_alphabet[digit];
  } while (vlq > 0);
  return out;
}

std::string line_source_map(
  const std::string & filename, std::string_view source, uint32_t first_line,
  uint32_t first_column, uint32_t line_count)
{
  // Segments are [generated column, source index, source line, source column],
  // every field but the generated column relative to the previous segment.
  std::string mappings;
  int32_t prev_line = 0;
  int32_t prev_column = 0;
  for (uint32_t i = 0; i < line_count; ++i) {
    if (i > 0) {
      mappings += ';';
    }
    const auto line = static_cast<int32_t>(first_line - 1 + i);
    const auto column = i == 0 ? static_cast<int32_t>(first_column - 1) : 0;
    mappings += base64_vlq(0);
    mappings += base64_vlq(0);
    mappings += base64_vlq(line - prev_line);
    mappings += base64_vlq(column - prev_column);
    prev_line = line;
    prev_column = column;
  }

  nlohmann::json map = {
    {"version", 3},
    {"file", filename},
    {"sources", nlohmann::json::array({filename})},
    {"sourcesContent", nlohmann::json::array({std::string(source)})},
    {"names", nlohmann::json::array()},
    {"mappings", mappings},
  };
  return map.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace modgraph
