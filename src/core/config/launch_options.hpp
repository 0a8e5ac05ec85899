#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace permaweb {

struct LaunchOptions {
  std::optional<std::string> url;
  std::optional<std::uint32_t> website_version;
  bool local_network = false;
  std::uint64_t timeout_seconds = 0;
  std::string data_dir = "permaweb-data";
  std::string log_level = "info";
  std::string config_path;
  std::vector<ExampleSite> examples;
  bool show_help = false;
};

struct LaunchParseResult {
  bool ok = false;
  LaunchOptions options;
  std::string message;

  static LaunchParseResult success(LaunchOptions value) {
    return {true, std::move(value), {}};
  }

  static LaunchParseResult failure(std::string msg) {
    return {false, {}, std::move(msg)};
  }
};

// Flags win over values read from --config FILE.
LaunchParseResult parse_launch_options(const std::vector<std::string>& args);
LaunchParseResult parse_launch_options(int argc, char** argv);

// key=value lines, '#' comments. Keys: url, website_version, local, timeout,
// data_dir, log_level, and example (repeatable, "Title | address").
Result apply_config_file(std::string_view path, LaunchOptions& options);
Result apply_setting(std::string_view key, std::string_view value, LaunchOptions& options);

InitConfig to_init_config(const LaunchOptions& options);
std::string launch_usage();

}  // namespace permaweb
