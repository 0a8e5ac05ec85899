#include "core/history/local_history_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/site/site_map.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace permaweb {
namespace {

constexpr std::string_view kHistoriesFile = "histories.dat";
constexpr std::string_view kBlobsDir = "blobs";
constexpr std::string_view kHistoriesHeader = "# permaweb histories.dat";

}  // namespace

Result LocalHistoryStore::open(std::string_view data_dir) {
  if (const Result sodium = util::ensure_sodium(); !sodium.ok) {
    return sodium;
  }

  std::lock_guard lock(mutex_);
  data_dir_ = std::string{data_dir};
  histories_path_ = (std::filesystem::path{data_dir_} / std::string{kHistoriesFile}).string();
  blobs_dir_ = (std::filesystem::path{data_dir_} / std::string{kBlobsDir}).string();

  std::error_code ec;
  std::filesystem::create_directories(blobs_dir_, ec);
  if (ec) {
    return Result::failure("Failed to create history store directory: " + ec.message());
  }

  const Result loaded = load_histories();
  if (!loaded.ok) {
    return loaded;
  }

  opened_ = true;
  spdlog::info("History store opened at {} ({} histories)", data_dir_, histories_.size());
  return Result::success("History store opened.");
}

Result LocalHistoryStore::load_histories() {
  histories_.clear();

  std::ifstream in(histories_path_);
  if (!in) {
    return Result::success("History file will be created on first write.");
  }

  std::size_t dropped = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }

    const auto fields = util::split_fields(line, '\t');
    const auto version = fields.size() == 4 ? util::parse_uint32(fields[1]) : std::nullopt;
    if (!version.has_value() || fields[0].empty()) {
      ++dropped;
      continue;
    }

    auto& records = histories_[std::string{fields[0]}];
    if (*version == 0) {
      continue;
    }
    if (*version != records.size() + 1 || !util::is_digest_hex(fields[2])) {
      ++dropped;
      continue;
    }

    std::int64_t published = 0;
    if (const auto stamp = util::parse_uint64(fields[3]); stamp.has_value()) {
      published = static_cast<std::int64_t>(*stamp);
    }
    records.push_back({.content_root = std::string{fields[2]}, .published_unix = published});
  }

  if (dropped > 0) {
    spdlog::warn("Dropped {} malformed lines from {}", dropped, histories_path_);
  }
  return Result::success("Loaded histories.dat entries.");
}

Result LocalHistoryStore::persist_line(std::string_view identifier, std::uint32_t version,
                                       const VersionRecord& record) const {
  std::error_code ec;
  const bool fresh = !std::filesystem::exists(histories_path_, ec);
  if (ec) {
    return Result::failure("Unable to inspect histories file: " + ec.message());
  }
  std::ofstream out(histories_path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure("Failed to write histories file.");
  }

  if (fresh) {
    out << kHistoriesHeader << '\n';
    out << "# identifier\tversion\tcontent_root\tpublished_unix\n";
  }
  out << identifier << '\t' << version << '\t' << record.content_root << '\t' << record.published_unix << '\n';
  if (!out.good()) {
    return Result::failure("Failed to flush histories file.");
  }
  return Result::success();
}

BoundsResult LocalHistoryStore::lookup_bounds(std::string_view identifier) {
  std::lock_guard lock(mutex_);
  if (!opened_ || offline_) {
    return BoundsResult::failure(ResolveError::Unavailable, "History store is not reachable.");
  }

  const auto it = histories_.find(std::string{identifier});
  if (it == histories_.end()) {
    return BoundsResult::failure(ResolveError::NotFound, "History not found: " + std::string{identifier});
  }

  return BoundsResult::success({.min_version = 1, .max_version = static_cast<std::uint32_t>(it->second.size())});
}

SnapshotResult LocalHistoryStore::fetch_snapshot(std::string_view identifier, std::uint32_t version) {
  std::lock_guard lock(mutex_);
  if (!opened_ || offline_) {
    return SnapshotResult::failure(ResolveError::Unavailable, "History store is not reachable.");
  }

  const auto it = histories_.find(std::string{identifier});
  if (it == histories_.end()) {
    return SnapshotResult::failure(ResolveError::NotFound, "History not found: " + std::string{identifier});
  }
  if (version < 1 || version > it->second.size()) {
    return SnapshotResult::failure(ResolveError::InvalidVersion,
                                   "Version " + std::to_string(version) + " is outside 1.." +
                                       std::to_string(it->second.size()));
  }

  return SnapshotResult::success({.version = version, .content_root = it->second[version - 1].content_root});
}

Result LocalHistoryStore::create_history() {
  std::lock_guard lock(mutex_);
  if (!opened_) {
    return Result::failure("create_history failed: store is not open.");
  }

  std::string identifier = util::random_identifier_hex();
  while (histories_.contains(identifier)) {
    identifier = util::random_identifier_hex();
  }
  return register_history_locked(identifier);
}

Result LocalHistoryStore::register_history(std::string_view identifier) {
  std::lock_guard lock(mutex_);
  if (!opened_) {
    return Result::failure("register_history failed: store is not open.");
  }
  if (!util::is_digest_hex(identifier)) {
    return Result::failure("register_history failed: identifier must be 64 lowercase hex characters.");
  }
  if (histories_.contains(std::string{identifier})) {
    return Result::success("History already present.", std::string{identifier});
  }
  return register_history_locked(std::string{identifier});
}

Result LocalHistoryStore::register_history_locked(const std::string& identifier) {
  const Result persist = persist_line(identifier, 0, {.content_root = {}, .published_unix = util::unix_timestamp_now()});
  if (!persist.ok) {
    return persist;
  }

  histories_.emplace(identifier, std::vector<VersionRecord>{});
  spdlog::info("Created history {}", identifier);
  return Result::success("History created.", identifier);
}

Result LocalHistoryStore::append_version(std::string_view identifier, std::string_view content_root) {
  std::lock_guard lock(mutex_);
  return append_version_locked(std::string{identifier}, content_root);
}

Result LocalHistoryStore::append_version_locked(const std::string& identifier, std::string_view content_root) {
  if (!opened_) {
    return Result::failure("append_version failed: store is not open.");
  }
  if (!util::is_digest_hex(content_root)) {
    return Result::failure("append_version failed: content root is not a content hash.");
  }

  const auto it = histories_.find(identifier);
  if (it == histories_.end()) {
    return Result::failure("append_version failed: unknown history " + identifier);
  }

  const VersionRecord record{.content_root = std::string{content_root}, .published_unix = util::unix_timestamp_now()};
  const auto version = static_cast<std::uint32_t>(it->second.size() + 1);
  const Result persist = persist_line(identifier, version, record);
  if (!persist.ok) {
    return persist;
  }

  it->second.push_back(record);
  spdlog::info("Published version {} of {}", version, identifier);
  return Result::success("Version published.", std::to_string(version));
}

Result LocalHistoryStore::publish_site(std::string_view identifier, const std::vector<SiteFile>& files) {
  if (files.empty()) {
    return Result::failure("publish_site failed: no files to publish.");
  }

  std::lock_guard lock(mutex_);
  if (!opened_) {
    return Result::failure("publish_site failed: store is not open.");
  }

  SiteMap site_map;
  for (const auto& file : files) {
    const Result blob = store_blob_locked(file.content);
    if (!blob.ok) {
      return blob;
    }
    const Result added = site_map.add_resource(file.path, blob.data);
    if (!added.ok) {
      return added;
    }
  }

  const Result root = store_blob_locked(site_map.serialize());
  if (!root.ok) {
    return root;
  }
  return append_version_locked(std::string{identifier}, root.data);
}

Result LocalHistoryStore::store_blob(std::string_view content) {
  std::lock_guard lock(mutex_);
  if (!opened_) {
    return Result::failure("store_blob failed: store is not open.");
  }
  return store_blob_locked(content);
}

Result LocalHistoryStore::store_blob_locked(std::string_view content) const {
  const std::string hash = util::content_hash_hex(content);
  const std::filesystem::path path = std::filesystem::path{blobs_dir_} / hash;
  std::error_code ec;
  const bool stored = std::filesystem::exists(path, ec);
  if (ec) {
    return Result::failure("Unable to inspect blob " + hash + ": " + ec.message());
  }
  if (stored) {
    return Result::success("Blob already stored.", hash);
  }

  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return Result::failure("Unable to write blob " + hash);
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out.good()) {
    return Result::failure("Failed writing blob " + hash);
  }
  return Result::success("Blob stored.", hash);
}

Result LocalHistoryStore::read_blob(std::string_view content_hash) const {
  std::lock_guard lock(mutex_);
  if (!opened_ || offline_) {
    return Result::failure("History store is not reachable.");
  }
  if (!util::is_digest_hex(content_hash)) {
    return Result::failure("Not a content hash: " + std::string{content_hash});
  }

  std::ifstream in(std::filesystem::path{blobs_dir_} / std::string{content_hash}, std::ios::in | std::ios::binary);
  if (!in) {
    return Result::failure("Blob not found: " + std::string{content_hash});
  }

  std::ostringstream content;
  content << in.rdbuf();
  std::string bytes = content.str();
  if (util::content_hash_hex(bytes) != content_hash) {
    spdlog::warn("Blob {} failed its integrity check", content_hash);
    return Result::failure("Blob content does not match its hash: " + std::string{content_hash});
  }
  return Result::success("Blob read.", std::move(bytes));
}

void LocalHistoryStore::set_offline(bool offline) {
  std::lock_guard lock(mutex_);
  offline_ = offline;
}

std::size_t LocalHistoryStore::history_count() const {
  std::lock_guard lock(mutex_);
  return histories_.size();
}

}  // namespace permaweb
