#pragma once

#include "cuid/core/digest.h"
#include "cuid/core/entropy.h"
#include "cuid/core/identity.h"
#include "cuid/core/lazy.h"
#include "cuid/core/result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cuid::core {

inline constexpr std::size_t kV1FingerprintWidth = 4;
inline constexpr std::size_t kV2FingerprintLength = 32;

// FingerprintPolicy decides what happens when the host name cannot be determined.
// kFallback: substitute random material drawn once; the fingerprint is marked degraded
// kStrict: fail with kFingerprintUnavailable
enum class FingerprintPolicy {
  kFallback,  // NOLINT(readability-identifier-naming)
  kStrict,    // NOLINT(readability-identifier-naming)
};

// Fingerprint is the per-process value mixed into every ID.
// degraded is true when a random substitute stood in for the host name.
struct Fingerprint {
  std::string value;     // NOLINT(readability-identifier-naming)
  bool degraded{false};  // NOLINT(readability-identifier-naming)
};

// FingerprintCache memoizes one fingerprint for the process lifetime.
using FingerprintCache = Lazy<Fingerprint>;

// host_id folds a host name into one integer: length + 36 + sum of character codes.
[[nodiscard]] std::uint64_t host_id(std::string_view hostname);

// compute_v1_fingerprint returns 4 base-36 characters:
// 2 for the process id, 2 for the host id (each keeping the least-significant digits).
[[nodiscard]] Result<Fingerprint, CuidError> compute_v1_fingerprint(
    const ProcessIdentity& identity, IEntropySource& entropy, FingerprintPolicy policy);

// compute_v2_fingerprint hashes host name, process id and 32 random base-36 digits,
// and returns the first 32 characters of the base-36 digest.
[[nodiscard]] Result<Fingerprint, CuidError> compute_v2_fingerprint(
    const ProcessIdentity& identity, IEntropySource& entropy, const IDigest& digest,
    FingerprintPolicy policy);

}  // namespace cuid::core
