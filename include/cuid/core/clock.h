#pragma once

#include <cstdint>

namespace cuid::core {

// IClock supplies the timestamp field of every identifier.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return milliseconds since the Unix epoch. Read fresh on every call, never cached.
  virtual std::int64_t now_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Wall clock backed by std::chrono::system_clock.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_millis() override;
};

// Clock pinned to a settable instant.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_millis() override;

  void set(std::int64_t fixed_millis) { fixed_millis_ = fixed_millis; }

 private:
  std::int64_t fixed_millis_;
};

}  // namespace cuid::core
