#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace waypoint::db {

/*
  Backend-neutral outcome of a storage call.

  SQLite result codes and pqxx exceptions are both folded into these, so the
  savers and their callers only ever see util::StorageError carrying an
  ErrorCode. Duplicate blob and write inserts are not errors: both backends
  resolve them with ON CONFLICT / OR IGNORE before a code is produced.
*/
enum class ErrorCode {
  OK = 0,

  // another writer holds the database (SQLITE_BUSY, lock timeouts)
  Busy,
  ConstraintViolation,
  // concurrent transaction lost a serialization or deadlock check
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
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

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace waypoint::db
