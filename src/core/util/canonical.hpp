#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace permaweb::util {

std::int64_t unix_timestamp_now();
std::int64_t steady_millis_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

// Accepts plain decimal digits only; no sign, no whitespace, no overflow.
std::optional<std::uint32_t> parse_uint32(std::string_view text);
std::optional<std::uint64_t> parse_uint64(std::string_view text);

std::vector<std::string_view> split_fields(std::string_view line, char separator);

}  // namespace permaweb::util
