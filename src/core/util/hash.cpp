#include "core/util/hash.hpp"

#include <algorithm>
#include <array>

#include <sodium.h>

namespace permaweb::util {
namespace {

std::string to_hex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(bytes[i] >> 4U) & 0x0FU]);
    out.push_back(kHex[bytes[i] & 0x0FU]);
  }
  return out;
}

}  // namespace

Result ensure_sodium() {
  // sodium_init returns 1 when already initialised.
  if (sodium_init() < 0) {
    return Result::failure("libsodium initialization failed.");
  }
  return Result::success("libsodium ready.");
}

std::string content_hash_hex(std::string_view payload) {
  static_assert(kDigestBytes >= crypto_generichash_BYTES_MIN && kDigestBytes <= crypto_generichash_BYTES_MAX);
  std::array<unsigned char, kDigestBytes> digest{};
  crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()), nullptr, 0);
  return to_hex(digest.data(), digest.size());
}

std::string random_identifier_hex() {
  std::array<unsigned char, kDigestBytes> bytes{};
  randombytes_buf(bytes.data(), bytes.size());
  return to_hex(bytes.data(), bytes.size());
}

std::string well_known_identifier(std::string_view name) {
  return content_hash_hex(name);
}

bool is_digest_hex(std::string_view text) {
  if (text.size() != kDigestBytes * 2U) {
    return false;
  }
  return std::ranges::all_of(text, [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

}  // namespace permaweb::util
