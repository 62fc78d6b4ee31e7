#pragma once

#include "cuid/core/clock.h"
#include "cuid/core/digest.h"
#include "cuid/core/entropy.h"
#include "cuid/core/identity.h"

namespace cuid::core {

// Services bundles the external collaborators ID generation depends on.
// It holds references (not ownership). The entry point creates the concrete
// instances and keeps them alive for as long as any Context uses them.
struct Services {
  IClock& clock;                 // NOLINT(readability-identifier-naming)
  IEntropySource& entropy;       // NOLINT(readability-identifier-naming)
  IIdentityProvider& identity;   // NOLINT(readability-identifier-naming)
  const IDigest& digest;         // NOLINT(readability-identifier-naming)

  Services(IClock& clock, IEntropySource& entropy, IIdentityProvider& identity,
           const IDigest& digest)
      : clock(clock), entropy(entropy), identity(identity), digest(digest) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace cuid::core
