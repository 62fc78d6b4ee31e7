#pragma once

#include "cuid/core/counter.h"
#include "cuid/core/fingerprint.h"
#include "cuid/core/lazy.h"
#include "cuid/core/services.h"
#include "cuid/v1/cuid.h"
#include "cuid/v2/cuid2.h"

#include <memory>
#include <string>

namespace cuid {

// Context owns the mutable state shared by every generator built on one set of services:
// - the v1 counter (starts at 0, wraps at 36^4)
// - the v2 counter (random start below 2057, wraps at 36^8), seeded on first use
// - the v1 and v2 fingerprints, each computed at most once
//
// Thread-safe. Generators returned by the accessors borrow from the Context and must
// not outlive it.
class Context {
 public:
  explicit Context(core::Services& services,
                   core::FingerprintPolicy policy = core::FingerprintPolicy::kFallback);
  ~Context() = default;

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;
  Context(Context&&) = delete;
  Context& operator=(Context&&) = delete;

  [[nodiscard]] v1::CuidGenerator v1_generator();
  [[nodiscard]] v1::SlugGenerator slug_generator();

  // Validates options first: an invalid length fails without drawing randomness.
  [[nodiscard]] core::Result<v2::Cuid2Generator, core::CuidError> v2_generator(
      const v2::Cuid2Options& options = {});

  [[nodiscard]] core::Result<std::string, core::CuidError> generate_v1();
  [[nodiscard]] core::Result<std::string, core::CuidError> slug();
  [[nodiscard]] core::Result<std::string, core::CuidError> generate_v2(
      std::size_t length = v2::kDefaultLength);

  [[nodiscard]] core::Result<core::Fingerprint, core::CuidError> fingerprint_v1();
  [[nodiscard]] core::Result<core::Fingerprint, core::CuidError> fingerprint_v2();

  [[nodiscard]] core::FingerprintPolicy policy() const { return policy_; }

 private:
  core::Services& services_;
  core::FingerprintPolicy policy_;
  core::MonotonicCounter v1_counter_;
  core::FingerprintCache v1_fingerprint_;
  core::FingerprintCache v2_fingerprint_;
  core::Lazy<std::shared_ptr<core::MonotonicCounter>> v2_counter_;
};

}  // namespace cuid
