#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "core/history/history_store.hpp"
#include "core/model/types.hpp"

namespace permaweb {

// Turns (identifier, requested version) into a concrete snapshot:
//   absent        -> latest
//   above maximum -> clamped down to the maximum
//   below 1       -> InvalidVersion
// Bounds are read on every call; fetched snapshots are immutable and cached,
// oldest entry evicted first once the cache holds max_cached_snapshots.
class HistoryResolver {
public:
  static constexpr std::size_t kDefaultMaxCachedSnapshots = 256;

  explicit HistoryResolver(IHistoryStore& store, std::size_t max_cached_snapshots = kDefaultMaxCachedSnapshots);

  ResolveResult resolve(std::string_view identifier, std::optional<std::uint32_t> requested_version);

  // True when the network's history type marker resolves.
  bool network_compatible(std::string_view marker_identifier);

  [[nodiscard]] std::size_t cached_snapshots() const;
  [[nodiscard]] std::uint64_t fetch_count() const;
  void clear_cache();

private:
  using CacheKey = std::pair<std::string, std::uint32_t>;

  IHistoryStore& store_;
  std::size_t max_cached_snapshots_;

  mutable std::mutex cache_mutex_;
  std::map<CacheKey, Snapshot> cache_;
  std::deque<CacheKey> cache_order_;
  std::uint64_t fetch_count_ = 0;
};

}  // namespace permaweb
