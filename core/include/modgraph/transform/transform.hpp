// modgraph/transform/transform.hpp - Per-extension source transforms
//
// A transform turns source text into executable module code. Transforms are
// registered per lowercase file extension; an extension without a transform
// is skipped by the graph builder with a warning.
//
#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace modgraph
{

struct TransformOptions
{
  /// Source dialect ("js", "ts", "json", ...); empty selects the extension
  std::string loader;

  bool source_map = true;

  /// Compile-time replacements forwarded to the transform
  std::map<std::string, std::string> define;
};

struct TransformOutput
{
  std::string code;

  /// JSON source map, empty when none was produced
  std::string map;
};

class ScriptTransform
{
public:
  virtual ~ScriptTransform() = default;

  /**
   * Transform `source` (read from `path`).
   *
   * @throws TransformError when the source cannot be transformed
   */
  [[nodiscard]] virtual TransformOutput transform(
    std::string_view source, const std::string & path, const TransformOptions & options) = 0;
};

// ============================================================================
// Registry
// ============================================================================

class TransformRegistry
{
public:
  /// Register (or replace) the transform for an extension (without dot).
  void add(std::string_view extension, std::shared_ptr<ScriptTransform> transform);

  /// Make `alias` use whatever transform `target` has. No-op if it has none.
  bool alias(std::string_view alias, std::string_view target);

  /// Transform for an extension, nullptr when none is registered.
  [[nodiscard]] ScriptTransform * find(std::string_view extension) const;

  [[nodiscard]] bool contains(std::string_view extension) const
  {
    return find(extension) != nullptr;
  }

  [[nodiscard]] std::vector<std::string> extensions() const;

private:
  std::unordered_map<std::string, std::shared_ptr<ScriptTransform>> transforms_;
};

/// Lowercase extension of `path` without the dot ("" when none).
[[nodiscard]] std::string extension_of(std::string_view path);

// ============================================================================
// Built-in transforms
// ============================================================================

/// Plain JavaScript modules: code is the source, no map.
class PassthroughTransform : public ScriptTransform
{
public:
  [[nodiscard]] TransformOutput transform(
    std::string_view source, const std::string & path, const TransformOptions & options) override;
};

/// JSON documents become `export default <json>`.
class JsonTransform : public ScriptTransform
{
public:
  [[nodiscard]] TransformOutput transform(
    std::string_view source, const std::string & path, const TransformOptions & options) override;
};

/// Registers js, mjs (pass-through) and json.
void register_builtin_transforms(TransformRegistry & registry);

}  // namespace modgraph
