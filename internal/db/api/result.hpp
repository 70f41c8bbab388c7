#pragma once

#include <string>
#include <string_view>

#include "internal/model/action_state.hpp"

namespace autopilot::db {

/*
  Outcome of a repository write. Backends translate sqlite / pqxx errors
  into these codes; nothing above the repository sees a driver type.

    NotFound        entity, outcome or action id is unknown
    AlreadyExists   duplicate action id, or a second roas_metrics row for
                    the same (scope, day)
    StatusMismatch  CompareAndSetActionStatus lost: the action is not in any
                    expected status. message holds the status it is in.
    Retryable       lock timeout, deadlock or serialization failure; the
                    whole transaction may be retried
    Constraint      any other integrity violation
    Unavailable     the store cannot be reached or written
    Internal        everything else
*/
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  StatusMismatch,
  Retryable,
  Constraint,
  Unavailable,
  Internal,
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::StatusMismatch:
      return "status_mismatch";
    case ErrorCode::Retryable:
      return "retryable";
    case ErrorCode::Constraint:
      return "constraint";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::Internal:
      return "internal";
  }
  return "internal";
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

  static Result StatusMismatch(autopilot::model::ActionStatus current) {
    return {ErrorCode::StatusMismatch, std::string(autopilot::model::ToString(current))};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace autopilot::db
