#pragma once

#include <string>
#include <string_view>

namespace canary::util {

/*
  Portable result codes for expected failures.

  Components return these instead of throwing for conditions an operator
  is expected to see (missing backup, declined confirmation, ...).
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  IntegrityFailure,
  MigrationFailure,
  MissingRollback,
  UnsupportedFormat,
  ConfirmationDeclined,
  InvalidState,

  Busy,
  Cancelled,
  IOError,
  InternalError
};

std::string_view ToString(ErrorCode code);

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

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::IntegrityFailure:
      return "integrity_failure";
    case ErrorCode::MigrationFailure:
      return "migration_failure";
    case ErrorCode::MissingRollback:
      return "missing_rollback";
    case ErrorCode::UnsupportedFormat:
      return "unsupported_format";
    case ErrorCode::ConfirmationDeclined:
      return "confirmation_declined";
    case ErrorCode::InvalidState:
      return "invalid_state";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace canary::util
