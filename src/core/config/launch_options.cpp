#include "core/config/launch_options.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>

#include "core/address/address_parser.hpp"
#include "core/util/canonical.hpp"

namespace permaweb {
namespace {

// Largest timeout whose millisecond value still fits the worker's signed clock.
constexpr std::uint64_t kMaxTimeoutSeconds =
    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) / 1000U;

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info", "warn",
                                                        "error", "critical", "off"};

std::optional<bool> parse_flag(std::string_view value) {
  const std::string lowered = util::lowercase_copy(util::trim_copy(value));
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  return std::nullopt;
}

// Maps a command line flag to its config key; empty when unknown.
std::string_view flag_key(std::string_view flag) {
  if (flag == "--website-version" || flag == "-v") {
    return "website_version";
  }
  if (flag == "--timeout") {
    return "timeout";
  }
  if (flag == "--data-dir") {
    return "data_dir";
  }
  if (flag == "--log-level") {
    return "log_level";
  }
  return {};
}

}  // namespace

Result apply_setting(std::string_view key, std::string_view value, LaunchOptions& options) {
  if (key == "url") {
    const std::string url = util::trim_copy(value);
    options.url = url.empty() ? std::nullopt : std::optional<std::string>{url};
    return Result::success();
  }
  if (key == "website_version") {
    const auto version = util::parse_uint32(util::trim_copy(value));
    if (!version.has_value()) {
      return Result::failure("website_version must be a non-negative integer, got '" + std::string{value} + "'.");
    }
    options.website_version = *version;
    return Result::success();
  }
  if (key == "local") {
    const auto flag = parse_flag(value);
    if (!flag.has_value()) {
      return Result::failure("local must be true or false, got '" + std::string{value} + "'.");
    }
    options.local_network = *flag;
    return Result::success();
  }
  if (key == "timeout") {
    const auto seconds = util::parse_uint64(util::trim_copy(value));
    if (!seconds.has_value()) {
      return Result::failure("timeout must be a whole number of seconds, got '" + std::string{value} + "'.");
    }
    if (*seconds > kMaxTimeoutSeconds) {
      return Result::failure("timeout must be at most " + std::to_string(kMaxTimeoutSeconds) + " seconds.");
    }
    options.timeout_seconds = *seconds;
    return Result::success();
  }
  if (key == "data_dir") {
    const std::string dir = util::trim_copy(value);
    if (dir.empty()) {
      return Result::failure("data_dir must not be empty.");
    }
    options.data_dir = dir;
    return Result::success();
  }
  if (key == "log_level") {
    const std::string level = util::lowercase_copy(util::trim_copy(value));
    for (const auto known : kLogLevels) {
      if (level == known) {
        options.log_level = level;
        return Result::success();
      }
    }
    return Result::failure("Unknown log level '" + std::string{value} + "'.");
  }
  if (key == "example") {
    const auto bar = value.find('|');
    const std::string title = util::trim_copy(value.substr(0, bar));
    const std::string address = bar == std::string_view::npos ? std::string{} : util::trim_copy(value.substr(bar + 1));
    if (title.empty() || !parse_address(address).ok) {
      return Result::failure("example must be 'Title | awx://address', got '" + std::string{value} + "'.");
    }
    options.examples.push_back({.title = title, .address = address});
    return Result::success();
  }
  return Result::failure("Unknown setting '" + std::string{key} + "'.");
}

Result apply_config_file(std::string_view path, LaunchOptions& options) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure("Unable to read config file " + std::string{path});
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      return Result::failure(std::string{path} + ":" + std::to_string(line_number) + ": expected key=value");
    }

    const Result applied =
        apply_setting(util::trim_copy(trimmed.substr(0, split)), trimmed.substr(split + 1), options);
    if (!applied.ok) {
      return Result::failure(std::string{path} + ":" + std::to_string(line_number) + ": " + applied.message);
    }
  }
  return Result::success("Config loaded.");
}

LaunchParseResult parse_launch_options(const std::vector<std::string>& args) {
  LaunchOptions options;

  // --config is applied first so that every other flag overrides the file.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] != "--config") {
      continue;
    }
    if (i + 1 >= args.size()) {
      return LaunchParseResult::failure("--config requires a file path.");
    }
    options.config_path = args[i + 1];
  }
  if (!options.config_path.empty()) {
    const Result loaded = apply_config_file(options.config_path, options);
    if (!loaded.ok) {
      return LaunchParseResult::failure(loaded.message);
    }
  }

  bool positional_seen = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--config") {
      ++i;
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
      continue;
    }
    if (arg == "--local") {
      options.local_network = true;
      continue;
    }

    std::string_view flag = arg;
    std::optional<std::string> inline_value;
    if (const auto eq = arg.find('='); arg.starts_with("--") && eq != std::string::npos) {
      flag = std::string_view{arg}.substr(0, eq);
      inline_value = arg.substr(eq + 1);
    }

    const std::string_view key = flag_key(flag);
    if (!key.empty()) {
      if (!inline_value.has_value()) {
        if (i + 1 >= args.size()) {
          return LaunchParseResult::failure(std::string{flag} + " requires a value.");
        }
        inline_value = args[++i];
      }
      const Result applied = apply_setting(key, *inline_value, options);
      if (!applied.ok) {
        return LaunchParseResult::failure(applied.message);
      }
      continue;
    }

    if (arg.starts_with("-")) {
      return LaunchParseResult::failure("Unknown option " + arg);
    }
    if (positional_seen) {
      return LaunchParseResult::failure("Only one address may be given, found '" + arg + "'.");
    }
    positional_seen = true;
    options.url = arg;
  }

  return LaunchParseResult::success(std::move(options));
}

LaunchParseResult parse_launch_options(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_launch_options(args);
}

InitConfig to_init_config(const LaunchOptions& options) {
  return {
      .app_data_dir = options.data_dir,
      .local_network = options.local_network,
      .resolve_timeout_ms = static_cast<std::int64_t>(std::min(options.timeout_seconds, kMaxTimeoutSeconds) * 1000U),
      .resolve_threads = 2,
      .seed_local_network = options.local_network,
      .examples = options.examples,
  };
}

std::string launch_usage() {
  return "usage: permaweb [ADDRESS] [options]\n"
         "\n"
         "  ADDRESS                  awx://<identifier>[/path][?v=<n>] or a bare identifier\n"
         "  -v, --website-version N  version to open (0 or omitted: latest)\n"
         "      --local              use the local network\n"
         "      --timeout SECS       give up on a lookup after SECS seconds (0: wait)\n"
         "      --data-dir DIR       local history store directory\n"
         "      --log-level LEVEL    trace, debug, info, warn, error, critical or off\n"
         "      --config FILE        read key=value settings; flags override them\n"
         "  -h, --help               show this text\n";
}

}  // namespace permaweb
