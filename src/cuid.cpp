#include "cuid/cuid.h"

#include "cuid/core/clock.h"
#include "cuid/core/digest.h"
#include "cuid/core/entropy.h"
#include "cuid/core/identity.h"

namespace cuid {

namespace {

// SystemRuntime is the composition root for the process-wide Context.
// Member order matters: services_ binds to the collaborators declared before it.
class SystemRuntime {
 public:
  SystemRuntime() : services_(clock_, entropy_, identity_, digest_), context_(services_) {}

  Context& context() { return context_; }

 private:
  core::SystemClock clock_;
  core::SystemEntropySource entropy_;
  core::SystemIdentityProvider identity_;
  core::Sha3_512Digest digest_;
  core::Services services_;
  Context context_;
};

}  // namespace

Context& default_context() {
  // Function-local static: initialized exactly once, even under concurrent first calls.
  static SystemRuntime runtime;
  return runtime.context();
}

core::Result<std::string, core::CuidError> generate_v1() {
  return default_context().generate_v1();
}

core::Result<std::string, core::CuidError> slug() {
  return default_context().slug();
}

core::Result<std::string, core::CuidError> generate_v2(const std::size_t length) {
  return default_context().generate_v2(length);
}

core::Result<core::Fingerprint, core::CuidError> fingerprint_v1() {
  return default_context().fingerprint_v1();
}

core::Result<core::Fingerprint, core::CuidError> fingerprint_v2() {
  return default_context().fingerprint_v2();
}

}  // namespace cuid
