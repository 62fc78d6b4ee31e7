#pragma once

#include "cuid/core/result.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>

namespace cuid::core {

// Lazy<T> computes a value at most once and then serves the cached copy.
//
// Concurrent first callers serialize on a mutex: exactly one runs the factory and the
// rest observe its value. A failed computation is not cached, so a later call retries.
// After initialization, get() is a single acquire load plus a copy.
template <typename T>
class Lazy {
 public:
  using Factory = std::function<Result<T, CuidError>()>;

  explicit Lazy(Factory factory) : factory_(std::move(factory)) {}
  ~Lazy() = default;

  // Not copyable or movable (contains mutex)
  Lazy(const Lazy&) = delete;
  Lazy& operator=(const Lazy&) = delete;
  Lazy(Lazy&&) = delete;
  Lazy& operator=(Lazy&&) = delete;

  [[nodiscard]] Result<T, CuidError> get() {
    if (ready_.load(std::memory_order_acquire)) {
      return Result<T, CuidError>::ok(*value_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ready_.load(std::memory_order_relaxed)) {
      auto computed = factory_();
      if (!computed.has_value()) {
        return computed;
      }
      value_.emplace(computed.value());
      ready_.store(true, std::memory_order_release);
    }
    return Result<T, CuidError>::ok(*value_);
  }

  [[nodiscard]] bool ready() const { return ready_.load(std::memory_order_acquire); }

 private:
  Factory factory_;
  std::mutex mutex_;
  std::optional<T> value_;
  std::atomic<bool> ready_{false};
};

}  // namespace cuid::core
