#include "cuid/core/entropy.h"

#include "cuid/core/base36.h"

#include <openssl/rand.h>

#include <limits>

namespace cuid::core {

namespace {

// A source that keeps producing rejected samples is treated as broken rather than
// looped on forever. With an honest source the odds of hitting this are below 2^-64.
constexpr int kMaxRejections = 64;

}  // namespace

Result<std::uint64_t, CuidError> IEntropySource::random_below(const std::uint64_t bound) {
  using R = Result<std::uint64_t, CuidError>;
  if (bound == 0) {
    return R::err(CuidError::kInvalidConfiguration);
  }

  // Smallest byte width whose range covers the bound.
  std::size_t width = 1;
  while (width < sizeof(std::uint64_t) && (std::uint64_t{1} << (8u * width)) < bound) {
    ++width;
  }

  // Accept samples below the largest multiple of bound that fits in the range.
  std::uint64_t limit = 0;
  if (width == sizeof(std::uint64_t)) {
    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t excess = (kMax % bound + 1) % bound;
    limit = kMax - excess;  // inclusive upper bound below
  } else {
    const std::uint64_t range = std::uint64_t{1} << (8u * width);
    limit = range - range % bound - 1;
  }

  for (int attempt = 0; attempt < kMaxRejections; ++attempt) {
    auto bytes = random_bytes(width);
    if (!bytes.has_value()) {
      return R::err(bytes.error());
    }
    std::uint64_t sample = 0;
    for (const std::uint8_t byte : bytes.value()) {
      sample = (sample << 8u) | byte;
    }
    if (sample <= limit) {
      return R::ok(sample % bound);
    }
  }
  return R::err(CuidError::kEntropyUnavailable);
}

Result<char, CuidError> IEntropySource::random_digit(const unsigned radix) {
  if (radix < kMinRadix || radix > kMaxRadix) {
    return Result<char, CuidError>::err(CuidError::kInvalidConfiguration);
  }
  auto value = random_below(radix);
  if (!value.has_value()) {
    return Result<char, CuidError>::err(value.error());
  }
  return Result<char, CuidError>::ok(kDigits[value.value()]);
}

Result<char, CuidError> IEntropySource::random_letter() {
  constexpr std::uint64_t kAlphabetSize = 26;
  auto value = random_below(kAlphabetSize);
  if (!value.has_value()) {
    return Result<char, CuidError>::err(value.error());
  }
  return Result<char, CuidError>::ok(static_cast<char>('a' + value.value()));
}

Result<std::vector<std::uint8_t>, CuidError> SystemEntropySource::random_bytes(
    const std::size_t count) {
  using R = Result<std::vector<std::uint8_t>, CuidError>;
  std::vector<std::uint8_t> buffer(count);
  if (count == 0) {
    return R::ok(std::move(buffer));
  }
  if (count > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return R::err(CuidError::kInvalidConfiguration);
  }
  if (RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
    return R::err(CuidError::kEntropyUnavailable);
  }
  return R::ok(std::move(buffer));
}

Result<std::vector<std::uint8_t>, CuidError> FixedEntropySource::random_bytes(
    const std::size_t count) {
  using R = Result<std::vector<std::uint8_t>, CuidError>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (script_.empty()) {
    return R::err(CuidError::kEntropyUnavailable);
  }

  std::vector<std::uint8_t> buffer;
  buffer.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    buffer.push_back(script_[position_ % script_.size()]);
    ++position_;
  }
  return R::ok(std::move(buffer));
}

std::size_t FixedEntropySource::consumed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return position_;
}

Result<std::string, CuidError> random_block(IEntropySource& source, const std::size_t digits,
                                            const unsigned radix) {
  std::string block;
  block.reserve(digits);
  for (std::size_t i = 0; i < digits; ++i) {
    auto digit = source.random_digit(radix);
    if (!digit.has_value()) {
      return Result<std::string, CuidError>::err(digit.error());
    }
    block.push_back(digit.value());
  }
  return Result<std::string, CuidError>::ok(std::move(block));
}

}  // namespace cuid::core
