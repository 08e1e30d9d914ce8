#include "digest.hpp"

#include <cctype>
#include <stdexcept>

namespace registry::util {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256: EVP_DigestInit_ex failed");
  }
}

void Sha256::Update(const void* data, std::size_t size) {
  if (finalized_) {
    throw std::logic_error("sha256: update after finalize");
  }
  if (size == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("sha256: EVP_DigestUpdate failed");
  }
  bytes_ += size;
}

std::string Sha256::HexDigest() {
  if (finalized_) {
    throw std::logic_error("sha256: digest already finalized");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("sha256: EVP_DigestFinal_ex failed");
  }
  finalized_ = true;

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

std::string Sha256::Of(std::string_view data) {
  Sha256 hasher;
  hasher.Update(data);
  return hasher.HexDigest();
}

bool IsContentHash(std::string_view hash) {
  if (hash.size() != Sha256::kHexLength) {
    return false;
  }
  for (char c : hash) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

std::string NormalizeContentHash(std::string_view hash) {
  static constexpr std::string_view kPrefix = "sha256:";
  if (hash.size() > kPrefix.size() && hash.substr(0, kPrefix.size()) == kPrefix) {
    hash.remove_prefix(kPrefix.size());
  }

  std::string out;
  out.reserve(hash.size());
  for (char c : hash) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (!IsContentHash(out)) {
    throw std::invalid_argument("content hash must be 64 hex characters (sha256)");
  }
  return out;
}

} // namespace registry::util
