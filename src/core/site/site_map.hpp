#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace permaweb {

// Directory -> (file name, content hash) map stored as the content root of every
// published snapshot. Directory keys start and end with '/'.
class SiteMap {
public:
  SiteMap();

  // website_path must start with '/', use '/' separators and name a file.
  Result add_resource(std::string_view website_path, std::string_view content_hash);

  // Exact file match first; otherwise the path is treated as a directory and the
  // first present default index file is returned.
  [[nodiscard]] std::optional<std::string> lookup(std::string_view resource_path) const;

  [[nodiscard]] std::string serialize() const;
  static std::optional<SiteMap> parse(std::string_view payload);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] const std::vector<std::string>& index_filenames() const { return index_filenames_; }

  static std::string webify_path(std::string_view path);

private:
  using Entries = std::vector<std::pair<std::string, std::string>>;

  static std::optional<std::string> find_name(const Entries& entries, std::string_view name);

  std::map<std::string, Entries> paths_to_files_;
  std::vector<std::string> index_filenames_;
};

}  // namespace permaweb
