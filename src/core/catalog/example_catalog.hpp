#pragma once

#include <string>
#include <vector>

#include "core/model/types.hpp"

namespace permaweb {

// Identifier of the welcome site seeded into a fresh local network.
std::string local_welcome_identifier();

// Built-in starting points shown by the shell. Has no effect on resolution. The
// public network has no built-in entries; they come from `example=` settings.
std::vector<ExampleSite> example_sites(bool local_network);

}  // namespace permaweb
