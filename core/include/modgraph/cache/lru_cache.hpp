// modgraph/cache/lru_cache.hpp - Bounded least-recently-used map
//
// Not synchronized: every cache in modgraph is mutated from the single
// thread driving graph construction. Hosts that share one across threads
// must serialize access themselves.
//
#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace modgraph
{

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache
{
public:
  struct Stats
  {
    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;
  };

  explicit LruCache(size_t max_entries) : max_entries_(max_entries == 0 ? 1 : max_entries) {}

  /// Lookup; a hit becomes the most recently used entry.
  [[nodiscard]] std::optional<Value> get(const Key & key)
  {
    auto it = lookup_.find(key);
    if (it == lookup_.end()) {
      ++stats_.misses;
      return std::nullopt;
    }
    ++stats_.hits;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
  }

  /// Lookup without touching recency or statistics.
  [[nodiscard]] const Value * peek(const Key & key) const
  {
    auto it = lookup_.find(key);
    return it == lookup_.end() ? nullptr : &it->second->second;
  }

  /// Insert or replace; evicts the least recently used entry when full.
  void set(const Key & key, Value value)
  {
    if (auto it = lookup_.find(key); it != lookup_.end()) {
      it->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, it->second);
      return;
    }

    while (entries_.size() >= max_entries_) {
      lookup_.erase(entries_.back().first);
      entries_.pop_back();
      ++stats_.evictions;
    }

    entries_.emplace_front(key, std::move(value));
    lookup_.emplace(key, entries_.begin());
  }

  bool erase(const Key & key)
  {
    auto it = lookup_.find(key);
    if (it == lookup_.end()) {
      return false;
    }
    entries_.erase(it->second);
    lookup_.erase(it);
    return true;
  }

  [[nodiscard]] bool contains(const Key & key) const { return lookup_.count(key) > 0; }

  void clear()
  {
    entries_.clear();
    lookup_.clear();
  }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] size_t capacity() const noexcept { return max_entries_; }
  [[nodiscard]] const Stats & stats() const noexcept { return stats_; }

private:
  using Entry = std::pair<Key, Value>;
  using EntryList = std::list<Entry>;

  size_t max_entries_;
  EntryList entries_;  // front = most recently used
  std::unordered_map<Key, typename EntryList::iterator, Hash> lookup_;
  Stats stats_;
};

}  // namespace modgraph
