#pragma once

#include <atomic>
#include <cstdint>

namespace cuid::core {

// MonotonicCounter hands out values in [0, ceiling), wrapping to 0 after ceiling - 1.
// Thread-safe and lock-free: each next() is a single compare-exchange, so concurrent
// callers never observe the same value and the sequence is strictly increasing modulo
// the ceiling in happens-before order.
class MonotonicCounter {
 public:
  // A ceiling of 0 is treated as 1 (the counter then always yields 0).
  // An initial value at or above the ceiling is reduced modulo the ceiling.
  explicit MonotonicCounter(std::uint64_t ceiling, std::uint64_t initial = 0);
  ~MonotonicCounter() = default;

  // Not copyable or movable (contains atomic counter)
  MonotonicCounter(const MonotonicCounter&) = delete;
  MonotonicCounter& operator=(const MonotonicCounter&) = delete;
  MonotonicCounter(MonotonicCounter&&) = delete;
  MonotonicCounter& operator=(MonotonicCounter&&) = delete;

  [[nodiscard]] std::uint64_t next();

  [[nodiscard]] std::uint64_t ceiling() const { return ceiling_; }

 private:
  const std::uint64_t ceiling_;
  std::atomic<std::uint64_t> value_;
};

}  // namespace cuid::core
