// modgraph/io/content_source.hpp - Read-through text providers
#pragma once

#include <memory>
#include <string>

#include "modgraph/cache/lru_cache.hpp"

namespace modgraph
{

class ContentSource
{
public:
  virtual ~ContentSource() = default;

  /**
   * Text of the module at `path` (a canonical path).
   *
   * @throws NotFoundError when the path does not exist
   */
  [[nodiscard]] virtual std::string read(const std::string & path) = 0;
};

/// Reads straight from the filesystem.
class FileContentSource : public ContentSource
{
public:
  [[nodiscard]] std::string read(const std::string & path) override;
};

/**
 * Raw-content cache: bounded LRU decorator over another ContentSource.
 *
 * Failed reads are not cached.
 */
class CachingContentSource : public ContentSource
{
public:
  CachingContentSource(std::unique_ptr<ContentSource> inner, size_t max_entries);

  [[nodiscard]] std::string read(const std::string & path) override;

  /// Drop the cached text of `path`; the next read goes to the inner source.
  bool invalidate(const std::string & path) { return cache_.erase(path); }

  void clear() { cache_.clear(); }

  [[nodiscard]] const LruCache<std::string, std::string> & cache() const noexcept { return cache_; }

private:
  std::unique_ptr<ContentSource> inner_;
  LruCache<std::string, std::string> cache_;
};

}  // namespace modgraph
