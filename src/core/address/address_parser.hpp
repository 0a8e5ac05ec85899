#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace permaweb {

// Accepts "awx://<identifier>[/path][?v=<n>]" or a bare identifier, which is
// read as if the awx:// prefix had been typed.
AddressParseResult parse_address(std::string_view raw);

std::string format_address(const Address& address);

// Address bar text once a snapshot is loaded: always carries v=<resolved_version>.
std::string canonical_address(const Address& address, std::uint32_t resolved_version);

}  // namespace permaweb
