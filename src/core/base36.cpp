#include "cuid/core/base36.h"

#include <algorithm>
#include <limits>
#include <vector>

namespace cuid::core {

namespace {

std::string natural_encoding(std::uint64_t value, const unsigned radix) {
  if (value == 0) {
    return "0";
  }

  std::string digits;
  while (value > 0) {
    digits.push_back(kDigits[value % radix]);
    value /= radix;
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

std::string fit_to_width(std::string digits, const std::size_t width) {
  if (digits.size() > width) {
    return digits.substr(digits.size() - width);
  }
  digits.insert(0, width - digits.size(), '0');
  return digits;
}

std::optional<unsigned> digit_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return static_cast<unsigned>(ch - '0');
  }
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<unsigned>(ch - 'a') + 10u;
  }
  return std::nullopt;
}

}  // namespace

Result<std::string, CuidError> encode(const std::uint64_t value, const unsigned radix,
                                      const std::size_t width) {
  if (radix < kMinRadix || radix > kMaxRadix || width == 0) {
    return Result<std::string, CuidError>::err(CuidError::kInvalidConfiguration);
  }
  return Result<std::string, CuidError>::ok(fit_to_width(natural_encoding(value, radix), width));
}

std::string encode36(const std::uint64_t value, const std::size_t width) {
  if (width == 0) {
    return std::string{};
  }
  return fit_to_width(natural_encoding(value, kBase36), width);
}

std::string to_base36(const std::uint64_t value) {
  return natural_encoding(value, kBase36);
}

std::optional<std::uint64_t> decode(const std::string_view text, const unsigned radix) {
  if (text.empty() || radix < kMinRadix || radix > kMaxRadix) {
    return std::nullopt;
  }

  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t value = 0;
  for (const char ch : text) {
    const auto digit = digit_value(ch);
    if (!digit.has_value() || digit.value() >= radix) {
      return std::nullopt;
    }
    if (value > (kMax - digit.value()) / radix) {
      return std::nullopt;
    }
    value = value * radix + digit.value();
  }
  return value;
}

std::string encode_bytes(const std::span<const std::uint8_t> bytes) {
  // Schoolbook long division of a big-endian byte string by 36, one remainder per pass.
  std::vector<std::uint8_t> number(bytes.begin(), bytes.end());
  std::size_t head = 0;
  while (head < number.size() && number[head] == 0) {
    ++head;
  }

  std::string digits;
  while (head < number.size()) {
    unsigned remainder = 0;
    for (std::size_t i = head; i < number.size(); ++i) {
      const unsigned accumulator = remainder * 256u + number[i];
      number[i] = static_cast<std::uint8_t>(accumulator / kBase36);
      remainder = accumulator % kBase36;
    }
    digits.push_back(kDigits[remainder]);
    while (head < number.size() && number[head] == 0) {
      ++head;
    }
  }

  if (digits.empty()) {
    return "0";
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

}  // namespace cuid::core
