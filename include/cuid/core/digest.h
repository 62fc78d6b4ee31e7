#pragma once

#include "cuid/core/result.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace cuid::core {

// IDigest is the pluggable hash strategy behind CUID2: bytes in, fixed-size digest out.
// Implementations must be deterministic and safe to call from several threads at once.
class IDigest {
 public:
  virtual ~IDigest() = default;

  // digest hashes input. Output size is always digest_size().
  [[nodiscard]] virtual Result<std::vector<std::uint8_t>, CuidError> digest(
      std::string_view input) const = 0;

  [[nodiscard]] virtual std::size_t digest_size() const = 0;

  // Stable strategy name, e.g. "sha3-512".
  [[nodiscard]] virtual std::string_view name() const = 0;

 protected:
  IDigest() = default;
  IDigest(const IDigest&) = default;
  IDigest& operator=(const IDigest&) = default;
  IDigest(IDigest&&) = default;
  IDigest& operator=(IDigest&&) = default;
};

// SHA3-512 through OpenSSL EVP. The default CUID2 strategy.
class Sha3_512Digest final : public IDigest {  // NOLINT(readability-identifier-naming)
 public:
  [[nodiscard]] Result<std::vector<std::uint8_t>, CuidError> digest(
      std::string_view input) const override;
  [[nodiscard]] std::size_t digest_size() const override { return 64; }
  [[nodiscard]] std::string_view name() const override { return "sha3-512"; }
};

// Self-contained SHA-256 (see sha256.h). Needs no crypto library at runtime.
class Sha256Digest final : public IDigest {
 public:
  [[nodiscard]] Result<std::vector<std::uint8_t>, CuidError> digest(
      std::string_view input) const override;
  [[nodiscard]] std::size_t digest_size() const override { return 32; }
  [[nodiscard]] std::string_view name() const override { return "sha256"; }
};

// make_digest maps a strategy name ("sha3-512" or "sha256") to an instance.
// Unknown names are kInvalidConfiguration.
[[nodiscard]] Result<std::shared_ptr<const IDigest>, CuidError> make_digest(std::string_view name);

}  // namespace cuid::core
