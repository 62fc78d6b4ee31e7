#include "cuid/v2/cuid2.h"

#include <algorithm>

namespace cuid::v2 {

namespace {

using StringResult = core::Result<std::string, core::CuidError>;

bool is_lower_alnum(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
}

}  // namespace

core::Result<Cuid2Options, core::CuidError> validate_options(const Cuid2Options& options) {
  if (options.length < kMinLength || options.length > kMaxLength) {
    return core::Result<Cuid2Options, core::CuidError>::err(
        core::CuidError::kInvalidConfiguration);
  }
  return core::Result<Cuid2Options, core::CuidError>::ok(options);
}

core::Result<Cuid2Generator, core::CuidError> Cuid2Generator::create(
    const Cuid2Options& options, core::IClock& clock, core::IEntropySource& entropy,
    core::MonotonicCounter& counter, core::FingerprintCache& fingerprint,
    const core::IDigest& digest) {
  using R = core::Result<Cuid2Generator, core::CuidError>;
  const auto validated = validate_options(options);
  if (!validated.has_value()) {
    return R::err(validated.error());
  }
  return R::ok(
      Cuid2Generator(validated.value().length, clock, entropy, counter, fingerprint, digest));
}

std::string hash_input(const std::int64_t millis, const std::string_view salt,
                       const std::uint64_t count, const std::string_view fingerprint) {
  std::string input = core::to_base36(millis < 0 ? 0 : static_cast<std::uint64_t>(millis));
  input += salt;
  input += core::to_base36(count);
  input += fingerprint;
  return input;
}

StringResult Cuid2Generator::next() const {
  auto fingerprint = fingerprint_.get();
  if (!fingerprint.has_value()) {
    return StringResult::err(fingerprint.error());
  }

  auto first = entropy_.random_letter();
  if (!first.has_value()) {
    return StringResult::err(first.error());
  }

  const std::int64_t millis = clock_.now_millis();
  auto salt = core::random_block(entropy_, length_);
  if (!salt.has_value()) {
    return StringResult::err(salt.error());
  }
  const std::uint64_t count = counter_.next();

  auto hashed = digest_.digest(hash_input(millis, salt.value(), count, fingerprint.value().value));
  if (!hashed.has_value()) {
    return StringResult::err(hashed.error());
  }

  // The leading digit of a big integer is biased toward small values; drop it.
  std::string body = core::encode_bytes(hashed.value()).substr(1);
  if (body.size() < length_ - 1) {
    body.insert(0, length_ - 1 - body.size(), '0');
  }

  std::string id;
  id.reserve(length_);
  id.push_back(first.value());
  id += body.substr(0, length_ - 1);
  return StringResult::ok(std::move(id));
}

bool is_cuid2(const std::string_view text) {
  if (text.size() < kMinLength || text.size() > kMaxLength) {
    return false;
  }
  if (text.front() < 'a' || text.front() > 'z') {
    return false;
  }
  return std::all_of(text.begin() + 1, text.end(), is_lower_alnum);
}

}  // namespace cuid::v2
