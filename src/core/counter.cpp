#include "cuid/core/counter.h"

namespace cuid::core {

MonotonicCounter::MonotonicCounter(const std::uint64_t ceiling, const std::uint64_t initial)
    : ceiling_(ceiling == 0 ? 1 : ceiling), value_(initial % (ceiling == 0 ? 1 : ceiling)) {}

std::uint64_t MonotonicCounter::next() {
  std::uint64_t current = value_.load(std::memory_order_relaxed);
  std::uint64_t following = 0;
  do {
    following = (current + 1 >= ceiling_) ? 0 : current + 1;
  } while (!value_.compare_exchange_weak(current, following, std::memory_order_acq_rel,
                                         std::memory_order_relaxed));
  return current;
}

}  // namespace cuid::core
