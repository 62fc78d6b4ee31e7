#include "cuid/core/clock.h"

#include <chrono>

namespace cuid::core {

std::int64_t SystemClock::now_millis() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::int64_t FixedClock::now_millis() {
  return fixed_millis_;
}

}  // namespace cuid::core
