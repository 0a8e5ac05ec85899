#include "core/history/history_resolver.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace permaweb {

HistoryResolver::HistoryResolver(IHistoryStore& store, std::size_t max_cached_snapshots)
    : store_(store), max_cached_snapshots_(std::max<std::size_t>(max_cached_snapshots, 1)) {}

ResolveResult HistoryResolver::resolve(std::string_view identifier,
                                       std::optional<std::uint32_t> requested_version) {
  if (identifier.empty()) {
    return ResolveResult::failure(ResolveError::NotFound, "Cannot resolve an empty identifier.");
  }
  if (requested_version.has_value() && *requested_version < 1) {
    return ResolveResult::failure(ResolveError::InvalidVersion, "Requested version must be 1 or greater.");
  }

  const BoundsResult bounds = store_.lookup_bounds(identifier);
  if (!bounds.ok) {
    spdlog::debug("Bounds lookup for {} failed: {}", identifier, bounds.message);
    return ResolveResult::failure(bounds.error, bounds.message);
  }
  if (bounds.bounds.max_version < 1) {
    return ResolveResult::failure(ResolveError::NotFound,
                                  "History has no published versions: " + std::string{identifier});
  }

  std::uint32_t effective = bounds.bounds.max_version;
  if (requested_version.has_value()) {
    effective = std::min(*requested_version, bounds.bounds.max_version);
    if (effective != *requested_version) {
      spdlog::info("Version {} of {} not published yet, showing {}", *requested_version, identifier, effective);
    }
  }

  CacheKey key{std::string{identifier}, effective};
  {
    std::lock_guard lock(cache_mutex_);
    if (const auto it = cache_.find(key); it != cache_.end()) {
      return ResolveResult::success(it->second, bounds.bounds);
    }
  }

  const SnapshotResult fetched = store_.fetch_snapshot(identifier, effective);
  if (!fetched.ok) {
    return ResolveResult::failure(fetched.error, fetched.message);
  }

  {
    std::lock_guard lock(cache_mutex_);
    ++fetch_count_;
    if (cache_.emplace(key, fetched.snapshot).second) {
      cache_order_.push_back(std::move(key));
      while (cache_order_.size() > max_cached_snapshots_) {
        cache_.erase(cache_order_.front());
        cache_order_.pop_front();
      }
    }
  }
  return ResolveResult::success(fetched.snapshot, bounds.bounds);
}

bool HistoryResolver::network_compatible(std::string_view marker_identifier) {
  return store_.lookup_bounds(marker_identifier).ok;
}

std::size_t HistoryResolver::cached_snapshots() const {
  std::lock_guard lock(cache_mutex_);
  return cache_.size();
}

std::uint64_t HistoryResolver::fetch_count() const {
  std::lock_guard lock(cache_mutex_);
  return fetch_count_;
}

void HistoryResolver::clear_cache() {
  std::lock_guard lock(cache_mutex_);
  cache_.clear();
  cache_order_.clear();
}

}  // namespace permaweb
