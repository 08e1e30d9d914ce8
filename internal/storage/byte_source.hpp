#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace registry::storage {

/*
  Pull-based byte stream feeding a publish.

  Next() fills `chunk` and returns true, or returns false at end of stream.
  Implementations throw util::Cancelled when the producer disconnects.
*/
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual bool Next(std::shared_ptr<arrow::Buffer>* chunk) = 0;
};

// Serves an in-memory byte string in fixed-size slices.
class BufferSource final : public ByteSource {
 public:
  explicit BufferSource(std::string bytes, std::size_t chunk_bytes = 64 * 1024);

  bool Next(std::shared_ptr<arrow::Buffer>* chunk) override;

 private:
  std::shared_ptr<arrow::Buffer> buffer_;
  int64_t                        offset_ = 0;
  int64_t                        chunk_bytes_;
};

} // namespace registry::storage
