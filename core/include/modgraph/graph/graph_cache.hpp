// modgraph/graph/graph_cache.hpp - Canonical path -> graph node store
//
// Every resolution registers a pending future before it loads anything, so a
// later resolution of the same path waits for (or reuses) that work instead
// of starting it again. Entries are never evicted; only explicit erase()
// removes them.
//
#pragma once

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "modgraph/graph/graph_node.hpp"

namespace modgraph
{

using NodePtr = std::shared_ptr<const GraphNode>;
using NodeFuture = std::shared_future<NodePtr>;

class GraphCache
{
public:
  GraphCache() = default;

  GraphCache(const GraphCache &) = delete;
  GraphCache & operator=(const GraphCache &) = delete;

  /**
   * Register `future` for `path`.
   *
   * @return false (and leaves the cache untouched) if the path is present
   */
  bool try_insert(const std::string & path, NodeFuture future)
  {
    return entries_.emplace(path, std::move(future)).second;
  }

  /// Pending or completed entry for `path`.
  [[nodiscard]] std::optional<NodeFuture> find(const std::string & path) const
  {
    const auto it = entries_.find(path);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  /// Completed node for `path`; nullptr when absent or still pending.
  [[nodiscard]] NodePtr get(const std::string & path) const
  {
    const auto it = entries_.find(path);
    if (it == entries_.end() || !is_ready(it->second)) {
      return nullptr;
    }
    return it->second.get();
  }

  [[nodiscard]] bool is_pending(const std::string & path) const
  {
    const auto it = entries_.find(path);
    return it != entries_.end() && !is_ready(it->second);
  }

  [[nodiscard]] bool contains(const std::string & path) const { return entries_.count(path) > 0; }

  bool erase(const std::string & path) { return entries_.erase(path) > 0; }

  void clear() { entries_.clear(); }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  /// All registered paths, sorted.
  [[nodiscard]] std::vector<std::string> paths() const
  {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto & [path, future] : entries_) {
      out.push_back(path);
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  [[nodiscard]] static bool is_ready(const NodeFuture & future)
  {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  }

private:
  std::unordered_map<std::string, NodeFuture> entries_;
};

}  // namespace modgraph
