#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace cuid::core {

inline constexpr std::size_t kSha256DigestSize = 32;

// sha256 returns the raw 32-byte SHA-256 digest of input.
//
// Implements FIPS 180-4 SHA-256.
// No external dependencies.
[[nodiscard]] std::array<std::uint8_t, kSha256DigestSize> sha256(std::string_view input);

// sha256_hex returns the same digest as a 64-character lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace cuid::core
