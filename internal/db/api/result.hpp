#pragma once

#include <cstdint>
#include <string>

namespace netsweep::db {

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

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  // rows touched by bulk deletes / replaces
  uint64_t affected = 0;

  static Result Ok(uint64_t affected_rows = 0) {
    Result r;
    r.affected = affected_rows;
    return r;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    Result r;
    r.code    = c;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace netsweep::db
