#pragma once

#include <stdexcept>
#include <string>

namespace registry::util {

/*
  Central error types.

  Every layer above the database and storage backends reports failures with
  one of these. The transport translates them to gRPC status codes, so the
  kind must survive unchanged up to the caller.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// (name, version) already taken by different content.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Hash or size mismatch between declared, stored and served bytes.
class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// IO or database failure that may succeed on retry.
class TransientStorageError : public std::runtime_error {
 public:
  explicit TransientStorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The peer went away before the operation completed.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace registry::util
