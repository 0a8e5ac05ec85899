#pragma once

#include <string_view>

namespace permaweb::util {

// Installs the stderr colour logger used by the shells and tests. Unknown level
// names fall back to info.
void init_logging(std::string_view level);

}  // namespace permaweb::util
