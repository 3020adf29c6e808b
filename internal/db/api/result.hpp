#pragma once

#include <stdexcept>
#include <string>

namespace roster::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  Timeout,
  Unavailable,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

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

/*
  Thrown by reads and by Transaction::Commit() when the backend fails.
  Writes report through Result instead.
*/
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  explicit DbError(const Result& result) : DbError(result.code, result.message) {
  }

  ErrorCode code() const noexcept {
    return code_;
  }

 private:
  ErrorCode code_;
};

// Transient failures where retrying the whole transaction can succeed.
inline bool IsRetryable(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::Conflict || code == ErrorCode::SerializationFailure ||
         code == ErrorCode::ConstraintViolation;
}

} // namespace roster::db
