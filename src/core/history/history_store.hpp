#pragma once

#include <cstdint>
#include <string_view>

#include "core/model/types.hpp"

namespace permaweb {

// Read side of the network's versioned history storage. Implementations may block
// on network I/O and are called from resolve worker threads.
class IHistoryStore {
public:
  virtual ~IHistoryStore() = default;

  virtual BoundsResult lookup_bounds(std::string_view identifier) = 0;
  virtual SnapshotResult fetch_snapshot(std::string_view identifier, std::uint32_t version) = 0;
};

}  // namespace permaweb
