#include "cuid/core/digest.h"

#include "cuid/core/sha256.h"

#include <openssl/evp.h>

namespace cuid::core {

Result<std::vector<std::uint8_t>, CuidError> Sha3_512Digest::digest(
    const std::string_view input) const {
  using R = Result<std::vector<std::uint8_t>, CuidError>;

  const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(),
                                                                        &EVP_MD_CTX_free);
  if (!context) {
    return R::err(CuidError::kDigestUnavailable);
  }
  if (EVP_DigestInit_ex(context.get(), EVP_sha3_512(), nullptr) != 1) {
    return R::err(CuidError::kDigestUnavailable);
  }
  if (EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1) {
    return R::err(CuidError::kDigestUnavailable);
  }

  std::vector<std::uint8_t> output(EVP_MAX_MD_SIZE);
  unsigned int written = 0;
  if (EVP_DigestFinal_ex(context.get(), output.data(), &written) != 1 ||
      written != digest_size()) {
    return R::err(CuidError::kDigestUnavailable);
  }
  output.resize(written);
  return R::ok(std::move(output));
}

Result<std::vector<std::uint8_t>, CuidError> Sha256Digest::digest(
    const std::string_view input) const {
  const auto hash = sha256(input);
  return Result<std::vector<std::uint8_t>, CuidError>::ok(
      std::vector<std::uint8_t>(hash.begin(), hash.end()));
}

Result<std::shared_ptr<const IDigest>, CuidError> make_digest(const std::string_view name) {
  using R = Result<std::shared_ptr<const IDigest>, CuidError>;
  if (name == "sha3-512") {
    return R::ok(std::make_shared<Sha3_512Digest>());
  }
  if (name == "sha256") {
    return R::ok(std::make_shared<Sha256Digest>());
  }
  return R::err(CuidError::kInvalidConfiguration);
}

}  // namespace cuid::core
