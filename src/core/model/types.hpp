#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace permaweb {

struct Result {
  bool ok = false;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload)};
  }

  static Result failure(std::string msg) {
    return {false, std::move(msg), {}};
  }
};

inline constexpr std::string_view kAddressScheme = "awx";
inline constexpr std::string_view kSchemeSeparator = "://";
inline constexpr std::string_view kVersionParam = "v";

struct Address {
  std::string scheme{kAddressScheme};
  std::string identifier;
  std::optional<std::uint32_t> requested_version;
  std::string resource_path = "/";

  bool operator==(const Address&) const = default;
};

enum class ParseError {
  InvalidVersion,
  EmptyIdentifier,
  UnsupportedScheme,
};

enum class ResolveError {
  NotFound,
  Unavailable,
  InvalidVersion,
};

struct VersionBounds {
  std::uint32_t min_version = 1;
  std::uint32_t max_version = 0;

  bool operator==(const VersionBounds&) const = default;
};

struct Snapshot {
  std::uint32_t version = 0;
  std::string content_root;

  bool operator==(const Snapshot&) const = default;
};

struct AddressParseResult {
  bool ok = false;
  Address address;
  ParseError error = ParseError::EmptyIdentifier;
  std::string message;

  static AddressParseResult success(Address parsed) {
    return {true, std::move(parsed), ParseError::EmptyIdentifier, {}};
  }

  static AddressParseResult failure(ParseError kind, std::string msg) {
    return {false, {}, kind, std::move(msg)};
  }
};

struct BoundsResult {
  bool ok = false;
  VersionBounds bounds;
  ResolveError error = ResolveError::NotFound;
  std::string message;

  static BoundsResult success(VersionBounds value) {
    return {true, value, ResolveError::NotFound, {}};
  }

  static BoundsResult failure(ResolveError kind, std::string msg) {
    return {false, {}, kind, std::move(msg)};
  }
};

struct SnapshotResult {
  bool ok = false;
  Snapshot snapshot;
  ResolveError error = ResolveError::NotFound;
  std::string message;

  static SnapshotResult success(Snapshot value) {
    return {true, std::move(value), ResolveError::NotFound, {}};
  }

  static SnapshotResult failure(ResolveError kind, std::string msg) {
    return {false, {}, kind, std::move(msg)};
  }
};

struct ResolveResult {
  bool ok = false;
  Snapshot snapshot;
  VersionBounds bounds;
  ResolveError error = ResolveError::NotFound;
  std::string message;

  static ResolveResult success(Snapshot value, VersionBounds range) {
    return {true, std::move(value), range, ResolveError::NotFound, {}};
  }

  static ResolveResult failure(ResolveError kind, std::string msg) {
    return {false, {}, {}, kind, std::move(msg)};
  }
};

enum class NavigationState {
  Idle,
  Resolving,
  Loaded,
  Failed,
};

enum class FailureSource {
  None,
  Parse,
  Resolve,
};

struct NavigationFailure {
  FailureSource source = FailureSource::None;
  ParseError parse_error = ParseError::EmptyIdentifier;
  ResolveError resolve_error = ResolveError::NotFound;
  std::string message;
};

struct NavigationStatus {
  NavigationState state = NavigationState::Idle;
  std::uint64_t request_id = 0;
  NavigationFailure failure;
};

struct ResolveTicket {
  std::uint64_t request_id = 0;
  std::string identifier;
  std::optional<std::uint32_t> requested_version;
};

struct ResolveCompletion {
  std::uint64_t request_id = 0;
  ResolveResult result;
};

struct SiteFile {
  std::string path;
  std::string content;
};

struct ExampleSite {
  std::string title;
  std::string address;
};

struct ViewState {
  std::string address_text;
  std::uint32_t version_value = 0;
  std::uint32_t version_max = 0;
  bool version_enabled = false;
  NavigationState state = NavigationState::Idle;
  std::string status_text;
};

struct InitConfig {
  std::string app_data_dir;
  bool local_network = false;
  std::int64_t resolve_timeout_ms = 0;
  std::size_t resolve_threads = 2;
  // Publishes the built-in welcome site on a fresh local network.
  bool seed_local_network = true;
  // Shown after the built-in examples.
  std::vector<ExampleSite> examples;
};

std::string to_string(ParseError error);
std::string to_string(ResolveError error);
std::string to_string(NavigationState state);
bool is_retryable(ResolveError error);

}  // namespace permaweb
