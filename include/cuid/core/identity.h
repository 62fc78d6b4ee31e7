#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cuid::core {

// ProcessIdentity is the opaque host/process data a fingerprint is derived from.
// hostname is nullopt when the host name cannot be determined.
struct ProcessIdentity {
  std::optional<std::string> hostname;  // NOLINT(readability-identifier-naming)
  std::uint64_t pid{0};                 // NOLINT(readability-identifier-naming)
};

// IIdentityProvider supplies the identity of the running process.
class IIdentityProvider {
 public:
  virtual ~IIdentityProvider() = default;

  [[nodiscard]] virtual ProcessIdentity identity() const = 0;

 protected:
  IIdentityProvider() = default;
  IIdentityProvider(const IIdentityProvider&) = default;
  IIdentityProvider& operator=(const IIdentityProvider&) = default;
  IIdentityProvider(IIdentityProvider&&) = default;
  IIdentityProvider& operator=(IIdentityProvider&&) = default;
};

// Production provider: gethostname() and getpid().
class SystemIdentityProvider final : public IIdentityProvider {
 public:
  [[nodiscard]] ProcessIdentity identity() const override;
};

// Fixed provider for tests; also used to simulate a host without a name.
class FixedIdentityProvider final : public IIdentityProvider {
 public:
  explicit FixedIdentityProvider(ProcessIdentity identity) : identity_(std::move(identity)) {}

  [[nodiscard]] ProcessIdentity identity() const override { return identity_; }

 private:
  ProcessIdentity identity_;
};

}  // namespace cuid::core
