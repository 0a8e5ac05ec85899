#include "core/address/address_parser.hpp"

#include "core/util/canonical.hpp"

namespace permaweb {
namespace {

struct VersionParam {
  bool valid = true;
  std::optional<std::uint32_t> version;
};

VersionParam read_version_param(std::string_view query) {
  VersionParam param;
  for (const std::string_view pair : util::split_fields(query, '&')) {
    const auto equals = pair.find('=');
    const std::string_view key = pair.substr(0, equals);
    if (key != kVersionParam) {
      continue;
    }

    const std::string_view value = equals == std::string_view::npos ? std::string_view{} : pair.substr(equals + 1);
    if (value.empty()) {
      param = {};
      continue;
    }

    const auto parsed = util::parse_uint32(value);
    if (!parsed.has_value()) {
      return {.valid = false, .version = std::nullopt};
    }
    param = {.valid = true, .version = *parsed == 0 ? std::nullopt : parsed};
  }
  return param;
}

}  // namespace

AddressParseResult parse_address(std::string_view raw) {
  std::string text = util::trim_copy(raw);
  if (text.empty()) {
    return AddressParseResult::failure(ParseError::EmptyIdentifier, "Address is empty.");
  }

  if (text.find(kSchemeSeparator) == std::string::npos) {
    text = std::string{kAddressScheme} + std::string{kSchemeSeparator} + text;
  }

  const auto separator = text.find(kSchemeSeparator);
  const std::string scheme = util::lowercase_copy(std::string_view{text}.substr(0, separator));
  if (scheme != kAddressScheme) {
    return AddressParseResult::failure(ParseError::UnsupportedScheme,
                                       "Unsupported address scheme '" + scheme + "'.");
  }

  std::string_view rest = std::string_view{text}.substr(separator + kSchemeSeparator.size());
  if (const auto fragment = rest.find('#'); fragment != std::string_view::npos) {
    rest = rest.substr(0, fragment);
  }

  std::string_view query;
  if (const auto question = rest.find('?'); question != std::string_view::npos) {
    query = rest.substr(question + 1);
    rest = rest.substr(0, question);
  }

  const auto slash = rest.find('/');
  const std::string_view identifier = rest.substr(0, slash);
  if (identifier.empty()) {
    return AddressParseResult::failure(ParseError::EmptyIdentifier,
                                       "Address has no history identifier: " + std::string{raw});
  }

  const VersionParam version = read_version_param(query);
  if (!version.valid) {
    return AddressParseResult::failure(ParseError::InvalidVersion,
                                       "Version parameter must be a non-negative integer: " + std::string{raw});
  }

  Address address;
  address.scheme = scheme;
  address.identifier = std::string{identifier};
  address.requested_version = version.version;
  address.resource_path = slash == std::string_view::npos ? "/" : std::string{rest.substr(slash)};
  return AddressParseResult::success(std::move(address));
}

std::string format_address(const Address& address) {
  std::string out = address.scheme;
  out.append(kSchemeSeparator);
  out.append(address.identifier);
  out.append(address.resource_path.empty() ? "/" : address.resource_path);
  if (address.requested_version.has_value() && *address.requested_version > 0) {
    out.push_back('?');
    out.append(kVersionParam);
    out.push_back('=');
    out.append(std::to_string(*address.requested_version));
  }
  return out;
}

std::string canonical_address(const Address& address, std::uint32_t resolved_version) {
  Address canonical = address;
  canonical.requested_version = resolved_version == 0 ? std::nullopt : std::optional<std::uint32_t>{resolved_version};
  return format_address(canonical);
}

}  // namespace permaweb
