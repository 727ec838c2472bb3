#pragma once

#include <string>
#include <utility>

namespace fetchbox::db {

/*
  Backend-neutral outcome of a repository call. SQLite status codes are
  mapped here (see sqlite_bind.hpp) so the queue and dead-letter layers
  only ever branch on ErrorCode.
*/
enum class ErrorCode {
  OK = 0,
  NotFound,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError,
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() { return {}; }
  static Result Err(ErrorCode code, std::string message = {}) { return {code, std::move(message)}; }

  explicit operator bool() const { return code == ErrorCode::OK; }
};

} // namespace fetchbox::db
