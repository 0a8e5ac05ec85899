#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace permaweb::util {

inline constexpr std::size_t kDigestBytes = 32;

Result ensure_sodium();

// Hex BLAKE2b-256 of the payload; the network's content address format.
std::string content_hash_hex(std::string_view payload);
std::string random_identifier_hex();

bool is_digest_hex(std::string_view text);

// History identifier for a name known to every local node.
std::string well_known_identifier(std::string_view name);

}  // namespace permaweb::util
