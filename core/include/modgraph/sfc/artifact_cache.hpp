// modgraph/sfc/artifact_cache.hpp - Compiled-Artifact Cache
//
// One entry per composite-file path. Each sub-field is set independently as
// its block compiles. A present sub-field is valid for the source text last
// seen for that path; the cache performs no staleness check of its own.
//
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "modgraph/cache/lru_cache.hpp"
#include "modgraph/sfc/descriptor.hpp"

namespace modgraph::sfc
{

/// Compiled behavior section plus the synthetic module wiring it up.
struct ScriptArtifact
{
  /// Behavior section after its source transform (before wiring)
  std::string code;
  std::string map;

  /// Synthetic executable module (`export default __script`)
  std::string main;
};

struct TemplateArtifact
{
  /// Render module with its inline source map appended
  std::string code;
  std::string map;
};

struct StyleArtifact
{
  std::string code;
  std::string map;
  std::optional<std::map<std::string, std::string>> modules;
  bool has_errors = false;
};

struct CacheEntry
{
  std::shared_ptr<const Descriptor> descriptor;
  std::shared_ptr<const ScriptArtifact> script;
  std::shared_ptr<const TemplateArtifact> template_artifact;

  /// Indexed by style block position; null = not compiled yet
  std::vector<std::shared_ptr<const StyleArtifact>> styles;
};

/**
 * Bounded LRU store of CacheEntry keyed by file path.
 *
 * A miss is a normal outcome, never an error.
 */
class ArtifactCache
{
public:
  static constexpr size_t k_default_max_entries = 65535;

  explicit ArtifactCache(size_t max_entries = k_default_max_entries) : entries_(max_entries) {}

  [[nodiscard]] std::optional<CacheEntry> get(const std::string & path)
  {
    return entries_.get(path);
  }

  void set(const std::string & path, CacheEntry entry) { entries_.set(path, std::move(entry)); }

  bool erase(const std::string & path) { return entries_.erase(path); }

  void clear() { entries_.clear(); }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] size_t capacity() const noexcept { return entries_.capacity(); }

private:
  LruCache<std::string, CacheEntry> entries_;
};

}  // namespace modgraph::sfc
