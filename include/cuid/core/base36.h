#pragma once

#include "cuid/core/result.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace cuid::core {

// Digit alphabet shared by every radix up to 36: 0-9 then a-z.
inline constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

inline constexpr unsigned kMinRadix = 2;
inline constexpr unsigned kMaxRadix = 36;
inline constexpr unsigned kBase36 = 36;

// encode maps value to the radix alphabet with an output of exactly `width` characters:
// - shorter encodings are left-padded with '0'
// - longer encodings keep only the last `width` (least-significant) digits
// Rejects radix outside [2, 36] and width == 0 with kInvalidConfiguration.
[[nodiscard]] Result<std::string, CuidError> encode(std::uint64_t value, unsigned radix,
                                                    std::size_t width);

// encode36 is the unchecked base-36 form of encode used on the hot path, where the
// width is a compile-time constant. Returns an empty string for width == 0.
[[nodiscard]] std::string encode36(std::uint64_t value, std::size_t width);

// to_base36 returns the natural (unpadded) base-36 encoding, "0" for zero.
[[nodiscard]] std::string to_base36(std::uint64_t value);

// decode parses lower-case digits of the given radix back into an integer.
// Returns nullopt for an empty string, a foreign character, a bad radix, or overflow.
[[nodiscard]] std::optional<std::uint64_t> decode(std::string_view text, unsigned radix);

// encode_bytes interprets bytes as one big-endian unsigned integer of arbitrary size
// (digests are 256 or 512 bits) and returns its natural base-36 encoding.
[[nodiscard]] std::string encode_bytes(std::span<const std::uint8_t> bytes);

// pad_width_ceiling returns 36^width: the number of distinct values a field of
// `width` base-36 digits can hold. Valid for width <= 12.
[[nodiscard]] constexpr std::uint64_t pad_width_ceiling(const std::size_t width) {
  std::uint64_t ceiling = 1;
  for (std::size_t i = 0; i < width; ++i) {
    ceiling *= kBase36;
  }
  return ceiling;
}

}  // namespace cuid::core
