#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace waypoint::util {

/*
  Central error types.

  Channel errors are part of the normal control flow of a step:
  EmptyChannelError means "omit this channel", never "fail".
*/

class EmptyChannelError : public std::runtime_error {
 public:
  explicit EmptyChannelError(const std::string& msg = "channel is empty") : std::runtime_error(msg) {
  }
};

class InvalidUpdateError : public std::runtime_error {
 public:
  explicit InvalidUpdateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedOperation : public std::runtime_error {
 public:
  explicit UnsupportedOperation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  StorageError(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

// Raises StorageError unless the result is OK.
inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  std::string message = context + " failed (" + std::string(db::ErrorCodeName(result.code)) + ")";
  if (!result.message.empty()) message += ": " + result.message;
  throw StorageError(result.code, message);
}

} // namespace waypoint::util
