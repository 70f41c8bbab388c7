#pragma once

#include <stdexcept>
#include <string>

namespace autopilot::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Guardrail blocks are NOT errors; they travel as decision values.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation attempted on an action in the wrong lifecycle phase.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed input rejected before any state change.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic transaction lost against a concurrent writer.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace autopilot::util
