#pragma once

#include <string>

namespace registry::db {

/*
  Outcome of a catalog repository write.

  Backends translate their native errors into these codes; the catalog maps
  them onto registry errors. Nothing above db/ sees a sqlite3 or pqxx error.

    ConstraintViolation    second live row for (name, version)
    Busy / Serialization   lock or snapshot conflict, safe to retry
    IOError                backend unreachable, safe to retry
    Corruption             database file damaged
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // The same write may succeed if attempted again in a new transaction.
  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure || code == ErrorCode::IOError;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace registry::db
