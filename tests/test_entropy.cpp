#include "cuid/core/entropy.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

using namespace cuid::core;

// ── FixedEntropySource ──────────────────────────────────────────────────────

TEST_CASE("FixedEntropySource replays and cycles its script", "[entropy]") {
  FixedEntropySource source({1, 2, 3});
  const auto bytes = source.random_bytes(5);
  REQUIRE(bytes.has_value());
  CHECK(bytes.value() == std::vector<std::uint8_t>{1, 2, 3, 1, 2});
  CHECK(source.consumed() == 5);
}

TEST_CASE("An empty script behaves as an unavailable source", "[entropy]") {
  FixedEntropySource source({});
  CHECK(source.random_bytes(1).error() == CuidError::kEntropyUnavailable);
  CHECK(source.random_digit(36).error() == CuidError::kEntropyUnavailable);
  CHECK(source.random_letter().error() == CuidError::kEntropyUnavailable);
  CHECK(random_block(source, 8).error() == CuidError::kEntropyUnavailable);
}

// ── random_below / random_digit / random_letter ─────────────────────────────

TEST_CASE("random_digit maps one byte onto the radix alphabet", "[entropy]") {
  FixedEntropySource zero({0});
  CHECK(zero.random_digit(36).value() == '0');

  FixedEntropySource ten({10});
  CHECK(ten.random_digit(36).value() == 'a');

  FixedEntropySource wrap({36});
  CHECK(wrap.random_digit(36).value() == '0');

  FixedEntropySource top({251});
  CHECK(top.random_digit(36).value() == 'z');
}

TEST_CASE("random_below rejects biased samples instead of folding them", "[entropy]") {
  // 252..255 would over-represent the first four digits; 252 is skipped.
  FixedEntropySource source({252, 5});
  CHECK(source.random_digit(36).value() == '5');
  CHECK(source.consumed() == 2);
}

TEST_CASE("random_below gives up on a source that only yields rejected samples",
          "[entropy]") {
  FixedEntropySource source({255});
  CHECK(source.random_below(36).error() == CuidError::kEntropyUnavailable);
}

TEST_CASE("random_below widens the sample for larger bounds", "[entropy]") {
  FixedEntropySource two_bytes({0x01, 0x02});
  CHECK(two_bytes.random_below(1000).value() == 258);
  CHECK(two_bytes.consumed() == 2);

  FixedEntropySource eight_bytes({0});
  CHECK(eight_bytes.random_below(std::uint64_t{1} << 60).value() == 0);
  CHECK(eight_bytes.consumed() == 8);
}

TEST_CASE("random_below and random_digit validate their arguments", "[entropy]") {
  FixedEntropySource source({0});
  CHECK(source.random_below(0).error() == CuidError::kInvalidConfiguration);
  CHECK(source.random_digit(1).error() == CuidError::kInvalidConfiguration);
  CHECK(source.random_digit(37).error() == CuidError::kInvalidConfiguration);
  CHECK(source.consumed() == 0);
}

TEST_CASE("random_letter yields a-z", "[entropy]") {
  FixedEntropySource last({25});
  CHECK(last.random_letter().value() == 'z');

  FixedEntropySource wrap({26});
  CHECK(wrap.random_letter().value() == 'a');
}

TEST_CASE("random_block draws the requested number of digits", "[entropy]") {
  FixedEntropySource zero({0});
  CHECK(random_block(zero, 8).value() == "00000000");

  FixedEntropySource mixed({10, 11, 12});
  CHECK(random_block(mixed, 4).value() == "abca");
  CHECK(random_block(mixed, 0).value().empty());
}

// ── SystemEntropySource ─────────────────────────────────────────────────────

TEST_CASE("SystemEntropySource returns fresh bytes", "[entropy][system]") {
  SystemEntropySource source;

  const auto first = source.random_bytes(32);
  const auto second = source.random_bytes(32);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value().size() == 32);
  CHECK(first.value() != second.value());

  const auto none = source.random_bytes(0);
  REQUIRE(none.has_value());
  CHECK(none.value().empty());
}

TEST_CASE("SystemEntropySource digits stay inside the alphabet", "[entropy][system]") {
  SystemEntropySource source;
  const auto block = random_block(source, 256);
  REQUIRE(block.has_value());
  for (const char ch : block.value()) {
    CHECK(((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z')));
  }
}
