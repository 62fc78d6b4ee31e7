#include "cuid/v1/cuid.h"

#include <algorithm>

namespace cuid::v1 {

namespace {

using StringResult = core::Result<std::string, core::CuidError>;

std::uint64_t millis_since_epoch(core::IClock& clock) {
  const std::int64_t millis = clock.now_millis();
  return millis < 0 ? 0 : static_cast<std::uint64_t>(millis);
}

std::string last_chars(const std::string& text, const std::size_t count) {
  return text.size() > count ? text.substr(text.size() - count) : text;
}

// Injected fingerprints are normally exactly kFingerprintWidth; anything else is
// padded or cut so the total length stays fixed.
std::string fixed_width(const std::string& text, const std::size_t width) {
  if (text.size() >= width) {
    return last_chars(text, width);
  }
  return std::string(width - text.size(), '0') + text;
}

bool is_lower_alnum(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
}

}  // namespace

StringResult CuidGenerator::next() const {
  // Fingerprint first: a strict-policy failure must not consume a counter value.
  auto fingerprint = fingerprint_.get();
  if (!fingerprint.has_value()) {
    return StringResult::err(fingerprint.error());
  }

  const std::string timestamp = core::encode36(millis_since_epoch(clock_), kTimestampWidth);
  const std::string counter = core::encode36(counter_.next(), kCounterWidth);

  auto random = core::random_block(entropy_, kRandomBlockWidth);
  if (!random.has_value()) {
    return StringResult::err(random.error());
  }

  std::string id;
  id.reserve(kCuidLength);
  id.push_back(kPrefix);
  id += timestamp;
  id += counter;
  id += fixed_width(fingerprint.value().value, kFingerprintWidth);
  id += random.value();
  return StringResult::ok(std::move(id));
}

StringResult SlugGenerator::next() const {
  auto fingerprint = fingerprint_.get();
  if (!fingerprint.has_value()) {
    return StringResult::err(fingerprint.error());
  }

  const std::string timestamp = core::to_base36(millis_since_epoch(clock_));
  const std::string counter = core::to_base36(counter_.next());

  auto random = core::random_block(entropy_, kCounterWidth);
  if (!random.has_value()) {
    return StringResult::err(random.error());
  }

  const std::string& print = fingerprint.value().value;
  std::string slug = last_chars(timestamp, 2) + last_chars(counter, 4);
  if (!print.empty()) {
    slug.push_back(print.front());
    slug.push_back(print.back());
  }
  slug += last_chars(random.value(), 2);
  return StringResult::ok(std::move(slug));
}

bool is_cuid(const std::string_view text) {
  return text.size() == kCuidLength && text.front() == kPrefix &&
         std::all_of(text.begin(), text.end(), is_lower_alnum);
}

bool is_slug(const std::string_view text) {
  return text.size() >= kMinSlugLength && text.size() <= kMaxSlugLength &&
         std::all_of(text.begin(), text.end(), is_lower_alnum);
}

}  // namespace cuid::v1
