#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/history/history_store.hpp"
#include "core/model/types.hpp"

namespace permaweb {

// Content-addressed history storage backed by a data directory. Serves the local
// network and tests; every call is safe from any thread.
class LocalHistoryStore final : public IHistoryStore {
public:
  Result open(std::string_view data_dir);

  BoundsResult lookup_bounds(std::string_view identifier) override;
  SnapshotResult fetch_snapshot(std::string_view identifier, std::uint32_t version) override;

  // Result::data carries the new identifier.
  Result create_history();
  // Adds an empty history under a well-known identifier; no-op when present.
  Result register_history(std::string_view identifier);
  // Result::data carries the new version number.
  Result publish_site(std::string_view identifier, const std::vector<SiteFile>& files);
  Result append_version(std::string_view identifier, std::string_view content_root);

  // Result::data carries the content hash.
  Result store_blob(std::string_view content);
  // Result::data carries the blob, verified against its hash.
  Result read_blob(std::string_view content_hash) const;

  // Simulates a transient storage outage: reads fail with Unavailable.
  void set_offline(bool offline);

  [[nodiscard]] std::size_t history_count() const;

private:
  struct VersionRecord {
    std::string content_root;
    std::int64_t published_unix = 0;
  };

  Result load_histories();
  Result persist_line(std::string_view identifier, std::uint32_t version, const VersionRecord& record) const;
  Result register_history_locked(const std::string& identifier);
  Result append_version_locked(const std::string& identifier, std::string_view content_root);
  Result store_blob_locked(std::string_view content) const;

  mutable std::mutex mutex_;
  bool opened_ = false;
  bool offline_ = false;
  std::string data_dir_;
  std::string histories_path_;
  std::string blobs_dir_;
  std::unordered_map<std::string, std::vector<VersionRecord>> histories_;
};

}  // namespace permaweb
