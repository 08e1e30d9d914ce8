#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace registry::util {

/*
  Incremental SHA-256 over OpenSSL EVP.

  Content hashes are rendered as 64 lowercase hex characters.
*/
class Sha256 {
 public:
  static constexpr std::size_t kHexLength = 64;

  Sha256();

  void Update(const void* data, std::size_t size);
  void Update(std::string_view data) {
    Update(data.data(), data.size());
  }

  // Finalizes the digest. The hasher cannot be updated afterwards.
  std::string HexDigest();

  uint64_t BytesHashed() const {
    return bytes_;
  }

  static std::string Of(std::string_view data);

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
      if (ctx) EVP_MD_CTX_free(ctx);
    }
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  uint64_t                                bytes_     = 0;
  bool                                    finalized_ = false;
};

/*
  Accepts "sha256:<hex>" or bare hex in any case and returns bare lowercase
  hex. Throws std::invalid_argument when the result is not a SHA-256 digest.
*/
std::string NormalizeContentHash(std::string_view hash);

bool IsContentHash(std::string_view hash);

} // namespace registry::util
