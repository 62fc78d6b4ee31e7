#include "cuid/core/fingerprint.h"

#include "cuid/core/base36.h"

namespace cuid::core {

namespace {

constexpr std::size_t kFieldWidth = kV1FingerprintWidth / 2;
constexpr std::uint64_t kHostIdSeed = 36;

using FingerprintResult = Result<Fingerprint, CuidError>;

}  // namespace

std::uint64_t host_id(const std::string_view hostname) {
  std::uint64_t id = hostname.size() + kHostIdSeed;
  for (const char ch : hostname) {
    id += static_cast<unsigned char>(ch);
  }
  return id;
}

FingerprintResult compute_v1_fingerprint(const ProcessIdentity& identity, IEntropySource& entropy,
                                         const FingerprintPolicy policy) {
  const std::string pid_field = encode36(identity.pid, kFieldWidth);

  if (identity.hostname.has_value()) {
    return FingerprintResult::ok(
        Fingerprint{pid_field + encode36(host_id(identity.hostname.value()), kFieldWidth), false});
  }

  if (policy == FingerprintPolicy::kStrict) {
    return FingerprintResult::err(CuidError::kFingerprintUnavailable);
  }

  auto substitute = random_block(entropy, kFieldWidth);
  if (!substitute.has_value()) {
    return FingerprintResult::err(substitute.error());
  }
  return FingerprintResult::ok(Fingerprint{pid_field + substitute.value(), true});
}

FingerprintResult compute_v2_fingerprint(const ProcessIdentity& identity, IEntropySource& entropy,
                                         const IDigest& digest, const FingerprintPolicy policy) {
  if (!identity.hostname.has_value() && policy == FingerprintPolicy::kStrict) {
    return FingerprintResult::err(CuidError::kFingerprintUnavailable);
  }

  auto salt = random_block(entropy, kV2FingerprintLength);
  if (!salt.has_value()) {
    return FingerprintResult::err(salt.error());
  }

  bool degraded = false;
  std::string host;
  if (identity.hostname.has_value()) {
    host = identity.hostname.value();
  } else {
    auto substitute = random_block(entropy, kV2FingerprintLength);
    if (!substitute.has_value()) {
      return FingerprintResult::err(substitute.error());
    }
    host = substitute.value();
    degraded = true;
  }

  auto hashed = digest.digest(host + to_base36(identity.pid) + salt.value());
  if (!hashed.has_value()) {
    return FingerprintResult::err(hashed.error());
  }

  std::string encoded = encode_bytes(hashed.value());
  if (encoded.size() < kV2FingerprintLength) {
    encoded.insert(0, kV2FingerprintLength - encoded.size(), '0');
  }
  return FingerprintResult::ok(Fingerprint{encoded.substr(0, kV2FingerprintLength), degraded});
}

}  // namespace cuid::core
