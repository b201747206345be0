#pragma once

#include <string>
#include <string_view>

namespace stageflow::db {

/*
  Outcome of one repository call.

  Backends map their native failures (sqlite return codes, pqxx
  exceptions) onto ErrorCode so that the event sink, the cache backend
  and the catalog can react without knowing which database is in use.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  // Run or template key taken.
  AlreadyExists,
  // Event sequence is not the next one in the run's log.
  Conflict,
  // Lock timeout; the caller may retry the transaction.
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
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

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // "<code>: <message>", or just the code name.
  std::string Describe() const {
    std::string text(ErrorCodeName(code));
    if (!message.empty()) text += ": " + message;
    return text;
  }
};

} // namespace stageflow::db
