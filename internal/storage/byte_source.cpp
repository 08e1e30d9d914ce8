#include "byte_source.hpp"

#include <algorithm>

namespace registry::storage {

BufferSource::BufferSource(std::string bytes, std::size_t chunk_bytes)
    : buffer_(arrow::Buffer::FromString(std::move(bytes))), chunk_bytes_(static_cast<int64_t>(std::max<std::size_t>(chunk_bytes, 1))) {
}

bool BufferSource::Next(std::shared_ptr<arrow::Buffer>* chunk) {
  if (offset_ >= buffer_->size()) return false;
  const int64_t length = std::min(chunk_bytes_, buffer_->size() - offset_);
  *chunk               = arrow::SliceBuffer(buffer_, offset_, length);
  offset_ += length;
  return true;
}

} // namespace registry::storage
