#pragma once

#include "cuid/core/base36.h"
#include "cuid/core/clock.h"
#include "cuid/core/counter.h"
#include "cuid/core/entropy.h"
#include "cuid/core/fingerprint.h"
#include "cuid/core/id_generator.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace cuid::v1 {

// Layout of a v1 CUID (25 characters):
//
//   c  | timestamp | counter | fingerprint | random
//   1  |     8     |    4    |      4      |   8
inline constexpr char kPrefix = 'c';
inline constexpr std::size_t kTimestampWidth = 8;
inline constexpr std::size_t kCounterWidth = 4;
inline constexpr std::size_t kFingerprintWidth = core::kV1FingerprintWidth;
inline constexpr std::size_t kRandomBlockWidth = 8;
inline constexpr std::size_t kCuidLength =
    1 + kTimestampWidth + kCounterWidth + kFingerprintWidth + kRandomBlockWidth;

inline constexpr std::uint64_t kCounterCeiling = core::pad_width_ceiling(kCounterWidth);

inline constexpr std::size_t kMinSlugLength = 7;
inline constexpr std::size_t kMaxSlugLength = 10;

// CuidGenerator composes v1 CUIDs from injected collaborators.
// Holds references only; the counter and fingerprint cache are shared, process-wide state
// owned by the caller (see cuid::Context).
class CuidGenerator final : public core::IIdGenerator {
 public:
  CuidGenerator(core::IClock& clock, core::IEntropySource& entropy,
                core::MonotonicCounter& counter, core::FingerprintCache& fingerprint)
      : clock_(clock), entropy_(entropy), counter_(counter), fingerprint_(fingerprint) {}

  [[nodiscard]] core::Result<std::string, core::CuidError> next() const override;

 private:
  core::IClock& clock_;
  core::IEntropySource& entropy_;
  core::MonotonicCounter& counter_;
  core::FingerprintCache& fingerprint_;
};

// SlugGenerator produces short 7-10 character v1 slugs:
// last 2 timestamp digits, last 4 counter digits, first and last fingerprint characters,
// 2 random digits. Far weaker than a full CUID; meant for URL fragments and similar.
class SlugGenerator final : public core::IIdGenerator {
 public:
  SlugGenerator(core::IClock& clock, core::IEntropySource& entropy,
                core::MonotonicCounter& counter, core::FingerprintCache& fingerprint)
      : clock_(clock), entropy_(entropy), counter_(counter), fingerprint_(fingerprint) {}

  [[nodiscard]] core::Result<std::string, core::CuidError> next() const override;

 private:
  core::IClock& clock_;
  core::IEntropySource& entropy_;
  core::MonotonicCounter& counter_;
  core::FingerprintCache& fingerprint_;
};

// is_cuid: exactly 25 characters of [a-z0-9] starting with 'c'.
[[nodiscard]] bool is_cuid(std::string_view text);

// is_slug: 7 to 10 characters of [a-z0-9].
[[nodiscard]] bool is_slug(std::string_view text);

}  // namespace cuid::v1
