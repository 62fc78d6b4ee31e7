#include "cuid/core/result.h"

namespace cuid::core {

std::string_view to_string(const CuidError error) {
  switch (error) {
    case CuidError::kEntropyUnavailable:
      return "entropy_unavailable";
    case CuidError::kFingerprintUnavailable:
      return "fingerprint_unavailable";
    case CuidError::kInvalidConfiguration:
      return "invalid_configuration";
    case CuidError::kDigestUnavailable:
      return "digest_unavailable";
  }
  return "unknown";
}

}  // namespace cuid::core
