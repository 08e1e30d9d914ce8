#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/util/digest.hpp"

namespace registry::storage::common {

inline void ValidateContentHash(const std::string& content_hash) {
  if (!util::IsContentHash(content_hash)) {
    throw std::invalid_argument("not a content hash: '" + content_hash + "'");
  }
}

inline std::filesystem::path BlobDir(const std::filesystem::path& root) {
  return root / "blobs";
}

inline std::filesystem::path StagingDir(const std::filesystem::path& root) {
  return root / "staging";
}

// <root>/blobs/ab/cd/abcd...
inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& content_hash) {
  ValidateContentHash(content_hash);
  return BlobDir(root) / content_hash.substr(0, 2) / content_hash.substr(2, 2) / content_hash;
}

inline std::filesystem::path StagingPath(const std::filesystem::path& root, const std::string& staging_id) {
  if (staging_id.empty() || staging_id.find('/') != std::string::npos || staging_id == "." || staging_id == "..") {
    throw std::invalid_argument("invalid staging id");
  }
  return StagingDir(root) / (staging_id + ".part");
}

} // namespace registry::storage::common
