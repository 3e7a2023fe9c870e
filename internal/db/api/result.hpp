#pragma once

#include <string>

namespace runvault::db {

/*
  Portable statement outcome.

  SQLite result codes and pqxx exceptions are folded into these before
  they leave internal/db. Stores see only ThrowIfDbError's translation.
*/

enum class ErrorCode {
  OK = 0,

  // SQLITE_BUSY / SQLITE_LOCKED
  Busy,
  // unique, not-null and foreign key failures
  ConstraintViolation,
  // postgres 40001
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "i/o error";
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

  static Result Err(ErrorCode c, std::string msg) {
    return {c, std::move(msg)};
  }

  bool Failed() const {
    return code != ErrorCode::OK;
  }

  explicit operator bool() const {
    return !Failed();
  }
};

} // namespace runvault::db
