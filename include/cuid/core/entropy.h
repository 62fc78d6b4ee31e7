#pragma once

#include "cuid/core/result.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace cuid::core {

// Abstract randomness source.
// Production code reads the operating system CSPRNG; tests replay a fixed byte script.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
//
// Failure contract: an unavailable source is reported as kEntropyUnavailable and is
// never replaced by a weaker generator.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Return exactly `count` random bytes.
  [[nodiscard]] virtual Result<std::vector<std::uint8_t>, CuidError> random_bytes(
      std::size_t count) = 0;

  // Uniform integer in [0, bound). Uses rejection sampling over the smallest number of
  // bytes that covers the bound, so there is no modulo bias.
  // bound == 0 is kInvalidConfiguration.
  [[nodiscard]] Result<std::uint64_t, CuidError> random_below(std::uint64_t bound);

  // One digit of the radix alphabet (radix in [2, 36]).
  [[nodiscard]] Result<char, CuidError> random_digit(unsigned radix);

  // One lower-case letter a-z.
  [[nodiscard]] Result<char, CuidError> random_letter();

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Production source: OpenSSL RAND_bytes.
class SystemEntropySource final : public IEntropySource {
 public:
  SystemEntropySource() = default;
  ~SystemEntropySource() override = default;

  SystemEntropySource(const SystemEntropySource&) = default;
  SystemEntropySource& operator=(const SystemEntropySource&) = default;
  SystemEntropySource(SystemEntropySource&&) = default;
  SystemEntropySource& operator=(SystemEntropySource&&) = default;

  [[nodiscard]] Result<std::vector<std::uint8_t>, CuidError> random_bytes(
      std::size_t count) override;
};

// Scripted source: replays `script` byte by byte, cycling when exhausted.
// For tests and demos where reproducible output is required.
// An empty script models a dead source and fails every request.
// Thread-safe.
class FixedEntropySource final : public IEntropySource {
 public:
  explicit FixedEntropySource(std::vector<std::uint8_t> script) : script_(std::move(script)) {}
  ~FixedEntropySource() override = default;

  // Not copyable or movable (contains mutex)
  FixedEntropySource(const FixedEntropySource&) = delete;
  FixedEntropySource& operator=(const FixedEntropySource&) = delete;
  FixedEntropySource(FixedEntropySource&&) = delete;
  FixedEntropySource& operator=(FixedEntropySource&&) = delete;

  [[nodiscard]] Result<std::vector<std::uint8_t>, CuidError> random_bytes(
      std::size_t count) override;

  // Number of bytes handed out so far.
  [[nodiscard]] std::size_t consumed() const;

 private:
  std::vector<std::uint8_t> script_;
  std::size_t position_{0};
  mutable std::mutex mutex_;
};

// random_block draws `digits` random characters of the radix alphabet.
[[nodiscard]] Result<std::string, CuidError> random_block(IEntropySource& source,
                                                          std::size_t digits,
                                                          unsigned radix = 36);

}  // namespace cuid::core
