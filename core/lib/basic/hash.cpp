// modgraph/basic/hash.cpp - hash-sum compatible string hashing
#include "modgraph/basic/hash.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <vector>

namespace modgraph
{

namespace
{

int32_t to_int32(int64_t v) noexcept
{
  return static_cast<int32_t>(static_cast<uint32_t>(static_cast<uint64_t>(v)));
}

/// UTF-8 -> UTF-16 code units; malformed bytes are taken as Latin-1.
std::vector<uint16_t> to_code_units(std::string_view text)
{
  std::vector<uint16_t> units;
  units.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    const auto c = static_cast<unsigned char>(text[i]);
    uint32_t cp = c;
    size_t len = 1;
    if (c >= 0xF0 && i + 3 < text.size()) {
      cp = ((c & 0x07U) << 18) | ((static_cast<unsigned char>(text[i + 1]) & 0x3FU) << 12) |
           ((static_cast<unsigned char>(text[i + 2]) & 0x3FU) << 6) |
           (static_cast<unsigned char>(text[i + 3]) & 0x3FU);
      len = 4;
    } else if (c >= 0xE0 && i + 2 < text.size()) {
      cp = ((c & 0x0FU) << 12) | ((static_cast<unsigned char>(text[i + 1]) & 0x3FU) << 6) |
           (static_cast<unsigned char>(text[i + 2]) & 0x3FU);
      len = 3;
    } else if (c >= 0xC0 && i + 1 < text.size()) {
      cp = ((c & 0x1FU) << 6) | (static_cast<unsigned char>(text[i + 1]) & 0x3FU);
      len = 2;
    }

    if (cp > 0xFFFF) {
      cp -= 0x10000;
      units.push_back(static_cast<uint16_t>(0xD800 + (cp >> 10)));
      units.push_back(static_cast<uint16_t>(0xDC00 + (cp & 0x3FF)));
    } else {
      units.push_back(static_cast<uint16_t>(cp));
    }
    i += len;
  }
  return units;
}

// JS: hash = ((hash << 5) - hash) + chr; hash |= 0;
// `hash` may exceed int32 between folds (negative results are doubled), so
// it is carried as int64 and truncated exactly where JS truncates.
int64_t fold(int64_t hash, std::string_view text)
{
  if (text.empty()) {
    return hash;
  }
  for (const uint16_t chr : to_code_units(text)) {
    const auto shifted = static_cast<int32_t>(static_cast<uint32_t>(to_int32(hash)) << 5);
    hash = to_int32(static_cast<int64_t>(shifted) - hash + chr);
  }
  return hash < 0 ? hash * -2 : hash;
}

}  // namespace

std::string hash_sum(std::string_view text)
{
  int64_t hash = fold(fold(fold(0, ""), "[object String]"), "string");
  hash = fold(hash, text);
  return fmt::format("{:0>8x}", static_cast<uint64_t>(hash));
}

std::string scope_id_for(std::string_view public_path)
{
  return "data-v-" + hash_sum(public_path);
}

}  // namespace modgraph
