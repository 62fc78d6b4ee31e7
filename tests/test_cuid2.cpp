#include "cuid/v2/cuid2.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <regex>
#include <set>
#include <string>

using namespace cuid;
using core::CuidError;
using core::Fingerprint;
using core::FingerprintCache;

namespace {

constexpr std::int64_t kMillis = 1700000000000;
const std::string kFingerprint = "k3v9q0c1x8m2w7z4r5t6y1u0i9o8p7a6";

core::Result<Fingerprint, CuidError> mocked_fingerprint() {
  return core::Result<Fingerprint, CuidError>::ok(Fingerprint{kFingerprint, false});
}

// Fixed collaborators for one CUID2 generator.
struct Fixture {
  explicit Fixture(std::uint8_t entropy_byte = 0, std::uint64_t counter_start = 0)
      : entropy({entropy_byte}), counter(v2::kCounterCeiling, counter_start) {}

  core::Result<v2::Cuid2Generator, CuidError> make(std::size_t length) {
    return v2::Cuid2Generator::create(v2::Cuid2Options{length}, clock, entropy, counter,
                                      fingerprint, digest);
  }

  core::FixedClock clock{kMillis};
  core::FixedEntropySource entropy;
  core::MonotonicCounter counter;
  FingerprintCache fingerprint{mocked_fingerprint};
  core::Sha3_512Digest digest;
};

std::size_t differing_positions(const std::string& a, const std::string& b) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < a.size() && i < b.size(); ++i) {
    if (a[i] != b[i]) {
      ++count;
    }
  }
  return count;
}

}  // namespace

// ── configuration ───────────────────────────────────────────────────────────

TEST_CASE("Cuid2Generator rejects lengths outside 2..32 before drawing randomness",
          "[cuid2][config]") {
  for (const std::size_t length : {std::size_t{0}, std::size_t{1}, std::size_t{33},
                                   std::size_t{1000}}) {
    Fixture fixture;
    const auto generator = fixture.make(length);
    REQUIRE_FALSE(generator.has_value());
    CHECK(generator.error() == CuidError::kInvalidConfiguration);
    CHECK(fixture.entropy.consumed() == 0);
    CHECK(fixture.counter.next() == 0);
  }
}

TEST_CASE("validate_options accepts the documented range", "[cuid2][config]") {
  CHECK(v2::validate_options(v2::Cuid2Options{}).value().length == v2::kDefaultLength);
  CHECK(v2::validate_options(v2::Cuid2Options{v2::kMinLength}).has_value());
  CHECK(v2::validate_options(v2::Cuid2Options{v2::kMaxLength}).has_value());
  CHECK_FALSE(v2::validate_options(v2::Cuid2Options{v2::kMaxLength + 1}).has_value());
}

// ── output shape ────────────────────────────────────────────────────────────

TEST_CASE("Cuid2Generator output has exactly the configured length", "[cuid2]") {
  const std::regex pattern("^[a-z][a-z0-9]*$");
  for (std::size_t length = v2::kMinLength; length <= v2::kMaxLength; ++length) {
    Fixture fixture(17);
    const auto generator = fixture.make(length);
    REQUIRE(generator.has_value());
    CHECK(generator.value().length() == length);

    const auto id = generator.value().next();
    REQUIRE(id.has_value());
    CHECK(id.value().size() == length);
    CHECK(std::regex_match(id.value(), pattern));
    CHECK(v2::is_cuid2(id.value()));
  }
}

TEST_CASE("Cuid2Generator defaults to 24 characters", "[cuid2]") {
  Fixture fixture;
  const auto generator = v2::Cuid2Generator::create(v2::Cuid2Options{}, fixture.clock,
                                                    fixture.entropy, fixture.counter,
                                                    fixture.fingerprint, fixture.digest);
  REQUIRE(generator.has_value());
  CHECK(generator.value().next().value().size() == 24);
}

TEST_CASE("Cuid2Generator works with the SHA-256 strategy at full length", "[cuid2]") {
  Fixture fixture(200);
  const core::Sha256Digest sha256;
  const auto generator =
      v2::Cuid2Generator::create(v2::Cuid2Options{v2::kMaxLength}, fixture.clock,
                                 fixture.entropy, fixture.counter, fixture.fingerprint, sha256);
  REQUIRE(generator.has_value());
  const auto id = generator.value().next();
  REQUIRE(id.has_value());
  CHECK(id.value().size() == v2::kMaxLength);
  CHECK(v2::is_cuid2(id.value()));
}

// ── determinism ─────────────────────────────────────────────────────────────

TEST_CASE("hash_input concatenates time, salt, count and fingerprint", "[cuid2]") {
  CHECK(v2::hash_input(36, "ab", 1, "fp") == "10ab1fp");
  CHECK(v2::hash_input(-5, "", 0, "") == "00");
}

TEST_CASE("Cuid2Generator is reproducible for fixed inputs", "[cuid2]") {
  Fixture first_fixture;
  Fixture second_fixture;
  const auto first = first_fixture.make(24).value().next();
  const auto second = second_fixture.make(24).value().next();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value() == second.value());
}

TEST_CASE("Cuid2Generator output is the truncated digest behind a random letter", "[cuid2]") {
  Fixture fixture;
  const auto id = fixture.make(24).value().next();
  REQUIRE(id.has_value());

  // Entropy byte 0 yields letter 'a' and an all-zero salt; the counter starts at 0.
  const std::string input = v2::hash_input(kMillis, std::string(24, '0'), 0, kFingerprint);
  const auto digest = core::Sha3_512Digest().digest(input);
  REQUIRE(digest.has_value());
  const std::string expected = "a" + core::encode_bytes(digest.value()).substr(1, 23);
  CHECK(id.value() == expected);
}

TEST_CASE("Changing any single input changes most of the output", "[cuid2][avalanche]") {
  Fixture base_fixture;
  const std::string base = base_fixture.make(24).value().next().value();

  SECTION("timestamp") {
    Fixture fixture;
    fixture.clock.set(kMillis + 1);
    const std::string other = fixture.make(24).value().next().value();
    CHECK(differing_positions(base.substr(1), other.substr(1)) >= 15);
  }

  SECTION("counter") {
    Fixture fixture(0, 1);
    const std::string other = fixture.make(24).value().next().value();
    CHECK(differing_positions(base.substr(1), other.substr(1)) >= 15);
  }

  SECTION("salt") {
    // Byte 1 turns every salt digit into '1' (and the letter into 'b').
    Fixture fixture(1);
    const std::string other = fixture.make(24).value().next().value();
    CHECK(differing_positions(base.substr(1), other.substr(1)) >= 15);
  }

  SECTION("fingerprint") {
    Fixture fixture;
    FingerprintCache flipped([] {
      std::string value = kFingerprint;
      value.back() = value.back() == '6' ? '7' : '6';
      return core::Result<Fingerprint, CuidError>::ok(Fingerprint{value, false});
    });
    const auto generator =
        v2::Cuid2Generator::create(v2::Cuid2Options{24}, fixture.clock, fixture.entropy,
                                   fixture.counter, flipped, fixture.digest);
    const std::string other = generator.value().next().value();
    CHECK(differing_positions(base.substr(1), other.substr(1)) >= 15);
  }
}

TEST_CASE("Cuid2Generator IDs differ across calls", "[cuid2]") {
  Fixture fixture;
  const auto generator = fixture.make(24);
  REQUIRE(generator.has_value());

  std::set<std::string> seen;
  for (int i = 0; i < 2000; ++i) {
    seen.insert(generator.value().next().value());
  }
  CHECK(seen.size() == 2000);
}

// ── failures ────────────────────────────────────────────────────────────────

TEST_CASE("Cuid2Generator surfaces entropy failure", "[cuid2][error]") {
  core::FixedClock clock(kMillis);
  core::FixedEntropySource dead({});
  core::MonotonicCounter counter(v2::kCounterCeiling);
  FingerprintCache fingerprint(mocked_fingerprint);
  const core::Sha3_512Digest digest;

  const auto generator =
      v2::Cuid2Generator::create(v2::Cuid2Options{}, clock, dead, counter, fingerprint, digest);
  REQUIRE(generator.has_value());
  const auto id = generator.value().next();
  REQUIRE_FALSE(id.has_value());
  CHECK(id.error() == CuidError::kEntropyUnavailable);
}

TEST_CASE("Cuid2Generator surfaces fingerprint failure", "[cuid2][error]") {
  Fixture fixture;
  FingerprintCache unavailable([] {
    return core::Result<Fingerprint, CuidError>::err(CuidError::kFingerprintUnavailable);
  });
  const auto generator =
      v2::Cuid2Generator::create(v2::Cuid2Options{}, fixture.clock, fixture.entropy,
                                 fixture.counter, unavailable, fixture.digest);
  REQUIRE(generator.has_value());
  const auto id = generator.value().next();
  REQUIRE_FALSE(id.has_value());
  CHECK(id.error() == CuidError::kFingerprintUnavailable);
}
