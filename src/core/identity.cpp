#include "cuid/core/identity.h"

#include <unistd.h>

#include <array>
#include <climits>
#include <cstring>

namespace cuid::core {

ProcessIdentity SystemIdentityProvider::identity() const {
  ProcessIdentity result;
  result.pid = static_cast<std::uint64_t>(::getpid());

#ifdef HOST_NAME_MAX
  std::array<char, HOST_NAME_MAX + 1> buffer{};
#else
  std::array<char, 256> buffer{};
#endif
  if (::gethostname(buffer.data(), buffer.size() - 1) == 0) {
    // POSIX does not promise termination on truncation.
    buffer.back() = '\0';
    const std::size_t length = std::strlen(buffer.data());
    if (length > 0) {
      result.hostname = std::string(buffer.data(), length);
    }
  }
  return result;
}

}  // namespace cuid::core
