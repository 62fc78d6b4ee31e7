#include "cuid/context.h"

namespace cuid {

Context::Context(core::Services& services, const core::FingerprintPolicy policy)
    : services_(services),
      policy_(policy),
      v1_counter_(v1::kCounterCeiling),
      v1_fingerprint_([this] {
        return core::compute_v1_fingerprint(services_.identity.identity(), services_.entropy,
                                            policy_);
      }),
      v2_fingerprint_([this] {
        return core::compute_v2_fingerprint(services_.identity.identity(), services_.entropy,
                                            services_.digest, policy_);
      }),
      v2_counter_([this] {
        using R = core::Result<std::shared_ptr<core::MonotonicCounter>, core::CuidError>;
        auto seed = services_.entropy.random_below(v2::kInitialCounterBound);
        if (!seed.has_value()) {
          return R::err(seed.error());
        }
        return R::ok(std::make_shared<core::MonotonicCounter>(v2::kCounterCeiling, seed.value()));
      }) {}

v1::CuidGenerator Context::v1_generator() {
  return v1::CuidGenerator(services_.clock, services_.entropy, v1_counter_, v1_fingerprint_);
}

v1::SlugGenerator Context::slug_generator() {
  return v1::SlugGenerator(services_.clock, services_.entropy, v1_counter_, v1_fingerprint_);
}

core::Result<v2::Cuid2Generator, core::CuidError> Context::v2_generator(
    const v2::Cuid2Options& options) {
  using R = core::Result<v2::Cuid2Generator, core::CuidError>;
  const auto validated = v2::validate_options(options);
  if (!validated.has_value()) {
    return R::err(validated.error());
  }

  auto counter = v2_counter_.get();
  if (!counter.has_value()) {
    return R::err(counter.error());
  }
  // The Lazy keeps its shared_ptr for the Context lifetime, so the reference stays valid.
  return v2::Cuid2Generator::create(validated.value(), services_.clock, services_.entropy,
                                    *counter.value(), v2_fingerprint_, services_.digest);
}

core::Result<std::string, core::CuidError> Context::generate_v1() {
  return v1_generator().next();
}

core::Result<std::string, core::CuidError> Context::slug() {
  return slug_generator().next();
}

core::Result<std::string, core::CuidError> Context::generate_v2(const std::size_t length) {
  auto generator = v2_generator(v2::Cuid2Options{length});
  if (!generator.has_value()) {
    return core::Result<std::string, core::CuidError>::err(generator.error());
  }
  return generator.value().next();
}

core::Result<core::Fingerprint, core::CuidError> Context::fingerprint_v1() {
  return v1_fingerprint_.get();
}

core::Result<core::Fingerprint, core::CuidError> Context::fingerprint_v2() {
  return v2_fingerprint_.get();
}

}  // namespace cuid
