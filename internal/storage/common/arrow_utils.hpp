#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace registry::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw.

  IO failures are reported as TransientStorageError so the upload
  coordinator can retry them; anything else is a std::runtime_error.
*/
inline void Unwrap(const arrow::Status& status) {
  if (status.ok()) return;
  if (status.IsIOError()) throw util::TransientStorageError(status.ToString());
  throw std::runtime_error(status.ToString());
}

template <typename T>
T Unwrap(arrow::Result<T> result) {
  Unwrap(result.status());
  return std::move(result).ValueOrDie();
}

} // namespace registry::storage::common
