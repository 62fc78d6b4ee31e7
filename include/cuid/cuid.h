#pragma once

#include "cuid/context.h"
#include "cuid/core/result.h"
#include "cuid/v1/cuid.h"
#include "cuid/v2/cuid2.h"

#include <cstddef>
#include <string>

namespace cuid {

// Process-wide entry points.
//
// All of them share one Context built on first use from the system clock, OpenSSL
// randomness, gethostname()/getpid() and SHA3-512, with FingerprintPolicy::kFallback.
// Every result is a printable ASCII string matching ^[a-z][a-z0-9]*$.

// generate_v1 returns a 25-character CUID.
[[nodiscard]] core::Result<std::string, core::CuidError> generate_v1();

// slug returns a 7-10 character v1 slug.
[[nodiscard]] core::Result<std::string, core::CuidError> slug();

// generate_v2 returns a CUID2 of `length` characters (2..32, default 24).
// Out-of-range lengths fail with kInvalidConfiguration.
[[nodiscard]] core::Result<std::string, core::CuidError> generate_v2(
    std::size_t length = v2::kDefaultLength);

[[nodiscard]] core::Result<core::Fingerprint, core::CuidError> fingerprint_v1();
[[nodiscard]] core::Result<core::Fingerprint, core::CuidError> fingerprint_v2();

// The shared Context behind the functions above.
[[nodiscard]] Context& default_context();

using v1::is_cuid;
using v1::is_slug;
using v2::is_cuid2;

}  // namespace cuid
