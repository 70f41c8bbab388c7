#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace autopilot::db {

// Raises the util exception matching a failed Result. A lost status
// compare-and-set surfaces as InvalidState; a retryable backend error as
// Conflict so the service-level retry loops pick it up.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::StatusMismatch:
      throw util::InvalidState(message);
    case ErrorCode::Retryable:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message + " (" + std::string(ToString(result.code)) + ")");
  }
}

} // namespace autopilot::db
