// modgraph/transform/transform.cpp - Transform registry and built-ins
#include "modgraph/transform/transform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

#include "modgraph/basic/errors.hpp"

namespace modgraph
{

namespace
{

std::string lowercase(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (!out.empty() && out.front() == '.') {
    out.erase(out.begin());
  }
  return out;
}

}  // namespace

// ============================================================================
// TransformRegistry
// ============================================================================

void TransformRegistry::add(std::string_view extension, std::shared_ptr<ScriptTransform> transform)
{
  transforms_[lowercase(extension)] = std::move(transform);
}

bool TransformRegistry::alias(std::string_view alias, std::string_view target)
{
  const auto it = transforms_.find(lowercase(target));
  if (it == transforms_.end()) {
    return false;
  }
  transforms_[lowercase(alias)] = it->second;
  return true;
}

ScriptTransform * TransformRegistry::find(std::string_view extension) const
{
  const auto it = transforms_.find(lowercase(extension));
  return it == transforms_.end() ? nullptr : it->second.get();
}

std::vector<std::string> TransformRegistry::extensions() const
{
  std::vector<std::string> out;
  out.reserve(transforms_.size());
  for (const auto & [ext, t] : transforms_) {
    out.push_back(ext);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::string extension_of(std::string_view path)
{
  const auto slash = path.find_last_of('/');
  const auto dot = path.find_last_of('.');
  if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
    return {};
  }
  return lowercase(path.substr(dot + 1));
}

// ============================================================================
// Built-ins
// ============================================================================

TransformOutput PassthroughTransform::transform(
  std::string_view source, const std::string & /*path*/, const TransformOptions & /*options*/)
{
  return TransformOutput{std::string(source), {}};
}

TransformOutput JsonTransform::transform(
  std::string_view source, const std::string & path, const TransformOptions & /*options*/)
{
  try {
    const auto doc = nlohmann::json::parse(source.begin(), source.end());
    return TransformOutput{"export default " + doc.dump() + ";\n", {}};
  } catch (const nlohmann::json::parse_error & e) {
    // parse_error::byte is 1-based and points past the offending character.
    const auto offset = e.byte > 0 ? static_cast<uint32_t>(e.byte - 1) : 0U;
    throw TransformError(path + ": invalid JSON: " + e.what(), offset);
  }
}

void register_builtin_transforms(TransformRegistry & registry)
{
  auto passthrough = std::make_shared<PassthroughTransform>();
  registry.add("js", passthrough);
  registry.add("mjs", passthrough);
  registry.add("json", std::make_shared<JsonTransform>());
}

}  // namespace modgraph
