#pragma once

#include "cuid/core/result.h"

#include <string>

namespace cuid::core {

// IIdGenerator lets entry points pick a scheme (CUID, slug, CUID2) at runtime.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // On success the ID is non-empty and contains only [a-z0-9].
  [[nodiscard]] virtual Result<std::string, CuidError> next() const = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

}  // namespace cuid::core
