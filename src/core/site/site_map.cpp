#include "core/site/site_map.hpp"

#include <algorithm>
#include <sstream>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace permaweb {
namespace {

constexpr std::string_view kSiteMapHeader = "# permaweb site map v1";
constexpr char kPathSeparator = '/';

bool needs_percent_encoding(unsigned char c) {
  return c < 0x20U || c == 0x7FU || c == ' ' || c == '"' || c == '<' || c == '>' || c == '`';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string percent_decode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      const int hi = hex_value(text[i + 1]);
      const int lo = hex_value(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

}  // namespace

SiteMap::SiteMap() : index_filenames_({"index.html", "index.htm"}) {}

std::string SiteMap::webify_path(std::string_view path) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string decoded = percent_decode(path);
  std::ranges::replace(decoded, '\\', kPathSeparator);

  std::string out;
  out.reserve(decoded.size());
  for (unsigned char c : decoded) {
    if (needs_percent_encoding(c)) {
      out.push_back('%');
      out.push_back(kHex[(c >> 4U) & 0x0FU]);
      out.push_back(kHex[c & 0x0FU]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

Result SiteMap::add_resource(std::string_view website_path, std::string_view content_hash) {
  if (!util::is_digest_hex(content_hash)) {
    return Result::failure("Site map entry needs a content hash: " + std::string{website_path});
  }

  std::string web_path = webify_path(website_path);
  if (web_path.empty() || web_path.front() != kPathSeparator) {
    return Result::failure("Website path must start with '/': " + std::string{website_path});
  }

  const auto last_separator = web_path.rfind(kPathSeparator);
  std::string file_name = web_path.substr(last_separator + 1);
  web_path.resize(last_separator + 1);
  if (file_name.empty()) {
    return Result::failure("Website path names a directory, not a file: " + std::string{website_path});
  }

  auto& entries = paths_to_files_[web_path];
  const auto existing = std::ranges::find_if(entries, [&file_name](const auto& entry) {
    return entry.first == file_name;
  });
  if (existing != entries.end()) {
    existing->second = std::string{content_hash};
  } else {
    entries.emplace_back(std::move(file_name), std::string{content_hash});
  }
  return Result::success("Resource added to site map.");
}

std::optional<std::string> SiteMap::find_name(const Entries& entries, std::string_view name) {
  const auto it = std::ranges::find_if(entries, [name](const auto& entry) {
    return entry.first == name;
  });
  if (it == entries.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> SiteMap::lookup(std::string_view resource_path) const {
  const auto last_separator = resource_path.rfind(kPathSeparator);
  if (last_separator == std::string_view::npos) {
    return std::nullopt;
  }

  const std::string directory{resource_path.substr(0, last_separator + 1)};
  const std::string_view name = resource_path.substr(last_separator + 1);
  if (!name.empty()) {
    if (const auto it = paths_to_files_.find(directory); it != paths_to_files_.end()) {
      if (auto hash = find_name(it->second, name); hash.has_value()) {
        return hash;
      }
    }
  }

  std::string as_directory{resource_path};
  if (as_directory.back() != kPathSeparator) {
    as_directory.push_back(kPathSeparator);
  }

  const auto it = paths_to_files_.find(as_directory);
  if (it == paths_to_files_.end()) {
    return std::nullopt;
  }

  for (const auto& index_file : index_filenames_) {
    if (auto hash = find_name(it->second, index_file); hash.has_value()) {
      return hash;
    }
  }
  return std::nullopt;
}

std::string SiteMap::serialize() const {
  std::ostringstream out;
  out << kSiteMapHeader << '\n';
  for (const auto& [directory, entries] : paths_to_files_) {
    Entries sorted = entries;
    std::ranges::sort(sorted);
    for (const auto& [name, hash] : sorted) {
      out << directory << '\t' << name << '\t' << hash << '\n';
    }
  }
  return out.str();
}

std::optional<SiteMap> SiteMap::parse(std::string_view payload) {
  if (!payload.starts_with(kSiteMapHeader)) {
    return std::nullopt;
  }

  SiteMap map;
  std::istringstream in{std::string{payload}};
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }

    const auto fields = util::split_fields(line, '\t');
    if (fields.size() != 3 || fields[0].empty() || fields[0].front() != kPathSeparator ||
        !util::is_digest_hex(fields[2])) {
      return std::nullopt;
    }
    map.paths_to_files_[std::string{fields[0]}].emplace_back(std::string{fields[1]}, std::string{fields[2]});
  }
  return map;
}

std::size_t SiteMap::size() const {
  std::size_t count = 0;
  for (const auto& [directory, entries] : paths_to_files_) {
    (void)directory;
    count += entries.size();
  }
  return count;
}

}  // namespace permaweb
