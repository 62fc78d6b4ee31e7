#pragma once

#include "cuid/core/base36.h"
#include "cuid/core/clock.h"
#include "cuid/core/counter.h"
#include "cuid/core/digest.h"
#include "cuid/core/entropy.h"
#include "cuid/core/fingerprint.h"
#include "cuid/core/id_generator.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cuid::v2 {

inline constexpr std::size_t kMinLength = 2;
inline constexpr std::size_t kMaxLength = 32;
inline constexpr std::size_t kDefaultLength = 24;

// The CUID2 counter starts at a random offset below kInitialCounterBound and wraps at
// kCounterCeiling (eight base-36 digits).
inline constexpr std::uint64_t kCounterCeiling = core::pad_width_ceiling(8);
inline constexpr std::uint64_t kInitialCounterBound = 2057;

// Cuid2Options configures a generator. Every field has an explicit default.
struct Cuid2Options {
  std::size_t length{kDefaultLength};  // NOLINT(readability-identifier-naming)
};

// validate_options rejects a length outside [kMinLength, kMaxLength].
// Out-of-range lengths are never clamped.
[[nodiscard]] core::Result<Cuid2Options, core::CuidError> validate_options(
    const Cuid2Options& options);

// Cuid2Generator produces CUID2 identifiers:
//
//   letter + hash(timestamp + salt + counter + fingerprint)[1 .. length - 1]
//
// The leading random letter keeps the ID identifier-safe. The hash hides the raw
// timestamp and counter; it is not a MAC and makes no unforgeability claim.
// The salt carries `length` random base-36 digits.
class Cuid2Generator final : public core::IIdGenerator {
 public:
  // create validates options before touching any collaborator.
  [[nodiscard]] static core::Result<Cuid2Generator, core::CuidError> create(
      const Cuid2Options& options, core::IClock& clock, core::IEntropySource& entropy,
      core::MonotonicCounter& counter, core::FingerprintCache& fingerprint,
      const core::IDigest& digest);

  [[nodiscard]] core::Result<std::string, core::CuidError> next() const override;

  [[nodiscard]] std::size_t length() const { return length_; }

 private:
  Cuid2Generator(std::size_t length, core::IClock& clock, core::IEntropySource& entropy,
                 core::MonotonicCounter& counter, core::FingerprintCache& fingerprint,
                 const core::IDigest& digest)
      : length_(length),
        clock_(clock),
        entropy_(entropy),
        counter_(counter),
        fingerprint_(fingerprint),
        digest_(digest) {}

  std::size_t length_;
  core::IClock& clock_;
  core::IEntropySource& entropy_;
  core::MonotonicCounter& counter_;
  core::FingerprintCache& fingerprint_;
  const core::IDigest& digest_;
};

// hash_input builds the string that is fed to the digest, in the fixed field order.
[[nodiscard]] std::string hash_input(std::int64_t millis, std::string_view salt,
                                     std::uint64_t count, std::string_view fingerprint);

// is_cuid2: 2 to 32 characters, a-z first, [a-z0-9] after.
[[nodiscard]] bool is_cuid2(std::string_view text);

}  // namespace cuid::v2
